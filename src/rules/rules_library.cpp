// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rules/rules_library.hpp"

#include "util/logging.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <dlfcn.h>

namespace rttfuzz {
namespace rules {

namespace {

std::string last_dl_error() {
  const char* err = dlerror();
  return err ? std::string(err) : std::string("unknown error");
}

}  // anonymous namespace

std::unique_ptr<RulesLibrary> RulesLibrary::Open(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("rules module '" + path + "' not found, specify it via RTT_RULES");
  }

  // dlopen only searches the library path for names without a slash
  std::string load_path = path.find('/') == std::string::npos ? "./" + path : path;

  void* handle = dlopen(load_path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    throw std::runtime_error("cannot load rules module '" + path + "': " + last_dl_error());
  }

  auto create = reinterpret_cast<rttfuzz_create_rules_fn>(dlsym(handle, RTTFUZZ_CREATE_RULES_SYMBOL));
  auto destroy = reinterpret_cast<rttfuzz_destroy_rules_fn>(dlsym(handle, RTTFUZZ_DESTROY_RULES_SYMBOL));
  if (!create || !destroy) {
    std::string err = last_dl_error();
    dlclose(handle);
    throw std::runtime_error("rules module '" + path + "' does not export " RTTFUZZ_CREATE_RULES_SYMBOL
                             "/" RTTFUZZ_DESTROY_RULES_SYMBOL ": " + err);
  }

  RulesEngine* engine = create();
  if (!engine) {
    dlclose(handle);
    throw std::runtime_error("rules module '" + path + "' returned no engine");
  }

  LOG_RULES_DEBUG("Loaded rules module {} ({} roles, {} scenarios)", path, engine->Roles().size(),
                  engine->Scenarios().size());
  return std::unique_ptr<RulesLibrary>(new RulesLibrary(path, handle, engine, destroy));
}

RulesLibrary::RulesLibrary(std::string path, void* handle, RulesEngine* engine, rttfuzz_destroy_rules_fn destroy)
    : path_(std::move(path)), handle_(handle), engine_(engine), destroy_(destroy) {}

RulesLibrary::~RulesLibrary() {
  if (engine_) {
    destroy_(engine_);
  }
  if (handle_) {
    dlclose(handle_);
  }
}

}  // namespace rules
}  // namespace rttfuzz
