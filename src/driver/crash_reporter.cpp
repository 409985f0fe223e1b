// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/crash_reporter.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"

#include <utility>

namespace rttfuzz {
namespace driver {

namespace {

std::string to_text(const json& value, int indent = -1) {
  return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // anonymous namespace

CrashReporter::CrashReporter(std::filesystem::path state_path, std::ostream& out)
    : state_path_(std::move(state_path)), out_(out) {}

void CrashReporter::Report(const CrashContext& context) noexcept {
  ++reports_;

  try {
    out_ << "\n";
    out_ << "VIEW " << to_text(context.view, 2) << "\n";
    out_ << "SETUP seed=" << context.setup.seed << " scenario=" << context.setup.scenario << "\n";
    if (context.action) {
      out_ << "STEP=" << context.step << " ACTIVE=" << context.active << " ACTION: " << *context.action << " "
           << to_text(context.arg.value_or(json())) << "\n";
    } else {
      out_ << "STEP=" << context.step << " ACTIVE=" << context.active << "\n";
    }

    if (util::atomic_write_file(state_path_, to_text(context.state))) {
      out_ << "STATE dumped to '" << state_path_.string() << "'\n\n";
    } else {
      out_ << "STATE could not be written to '" << state_path_.string() << "'\n\n";
    }
    out_.flush();
  } catch (const std::exception& e) {
    LOG_DRIVER_ERROR("CrashReporter: failed to write crash report for step {}: {}", context.step, e.what());
  }
}

std::optional<json> LoadCrashState(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_DRIVER_WARN("LoadCrashState: no snapshot at {}", path.string());
    return std::nullopt;
  }

  std::string text = util::read_file_string(path);
  json state = json::parse(text, nullptr, false);
  if (state.is_discarded()) {
    LOG_DRIVER_ERROR("LoadCrashState: {} is not valid JSON", path.string());
    return std::nullopt;
  }
  return state;
}

}  // namespace driver
}  // namespace rttfuzz
