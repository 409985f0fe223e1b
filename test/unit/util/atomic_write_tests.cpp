// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for atomic file writes used by crash snapshots (files.cpp)

#include <catch2/catch_test_macros.hpp>

#include "util/files.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

using namespace rttfuzz::util;

namespace {

// Fresh directory per test case, removed on scope exit
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag)
        : path(std::filesystem::temp_directory_path() / ("rttfuzz_files_" + tag + "_" + std::to_string(getpid()))) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

int CountTempFiles(const std::filesystem::path& dir) {
    int count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
            count++;
        }
    }
    return count;
}

}  // namespace

TEST_CASE("Atomic write: snapshot text round trip", "[atomic_write]") {
    ScratchDir dir("text");
    auto file_path = dir.path / "crash-state.json";
    std::string snapshot = "{\n  \"active\": \"X\",\n  \"board\": [\"\", \"O\", \"\"],\n  \"state\": \"play\"\n}";

    REQUIRE(atomic_write_file(file_path, snapshot));
    REQUIRE(read_file_string(file_path) == snapshot);
    REQUIRE(CountTempFiles(dir.path) == 0);
}

TEST_CASE("Atomic write: replaces the previous snapshot", "[atomic_write][overwrite]") {
    ScratchDir dir("overwrite");
    auto file_path = dir.path / "crash-state.json";

    std::string longer(4096, 'a');
    REQUIRE(atomic_write_file(file_path, longer));

    std::string shorter = "{\"state\":\"game_over\"}";
    REQUIRE(atomic_write_file(file_path, shorter));

    // No tail of the longer file survives
    REQUIRE(read_file_string(file_path) == shorter);
    REQUIRE(std::filesystem::file_size(file_path) == shorter.size());
    REQUIRE(CountTempFiles(dir.path) == 0);
}

TEST_CASE("Atomic write: byte API and modes", "[atomic_write][permissions]") {
    ScratchDir dir("modes");

    SECTION("Explicit mode") {
        auto file_path = dir.path / "private.bin";
        std::vector<uint8_t> data = {0x00, 0xFF, 0x10};
        REQUIRE(atomic_write_file(file_path, data, 0600));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
        REQUIRE(read_file(file_path) == data);
    }

    SECTION("Default mode is readable by the owner") {
        auto file_path = dir.path / "shared.bin";
        REQUIRE(atomic_write_file(file_path, std::vector<uint8_t>{0x01}));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0400) != 0);
    }

    SECTION("Empty payload") {
        auto file_path = dir.path / "empty.json";
        REQUIRE(atomic_write_file(file_path, std::string()));
        REQUIRE(std::filesystem::exists(file_path));
        REQUIRE(std::filesystem::file_size(file_path) == 0);
    }
}

TEST_CASE("Atomic write: creates missing directories", "[atomic_write][mkdir]") {
    ScratchDir dir("mkdir");
    auto file_path = dir.path / "runs" / "nightly" / "crash-state.json";

    REQUIRE(atomic_write_file(file_path, std::string("{}")));
    REQUIRE(std::filesystem::is_directory(dir.path / "runs" / "nightly"));
    REQUIRE(read_file_string(file_path) == "{}");

    REQUIRE(ensure_directory(dir.path / "runs"));
}

TEST_CASE("Atomic write: does not follow a symlink target", "[atomic_write][security]") {
    ScratchDir dir("symlink");
    auto real_file = dir.path / "real.json";
    auto link = dir.path / "link.json";
    {
        std::ofstream f(real_file);
        f << "original";
    }
    std::filesystem::create_symlink(real_file, link);

    // rename() replaces the link itself, never the file it points at
    REQUIRE(atomic_write_file(link, std::string("replacement")));
    REQUIRE(read_file_string(real_file) == "original");
    REQUIRE_FALSE(std::filesystem::is_symlink(link));
    REQUIRE(read_file_string(link) == "replacement");
}

TEST_CASE("Atomic write: concurrent writers", "[atomic_write][threading]") {
    ScratchDir dir("threads");
    std::vector<std::thread> threads;
    std::vector<int> results(4, 0);

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&dir, &results, t]() {
            results[t] = atomic_write_file(dir.path / ("state-" + std::to_string(t) + ".json"),
                                           std::string(100, static_cast<char>('a' + t)));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < 4; ++t) {
        REQUIRE(results[t]);
        REQUIRE(read_file_string(dir.path / ("state-" + std::to_string(t) + ".json")) ==
                std::string(100, static_cast<char>('a' + t)));
    }
    REQUIRE(CountTempFiles(dir.path) == 0);
}

TEST_CASE("Atomic write: failures leave nothing behind", "[atomic_write][readonly]") {
    ScratchDir dir("readonly");

    SECTION("Read-only directory") {
        if (geteuid() == 0) {
            WARN("Skipping readonly test when running as root");
            return;
        }
        std::filesystem::permissions(dir.path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec,
                                     std::filesystem::perm_options::replace);
        REQUIRE_FALSE(atomic_write_file(dir.path / "crash-state.json", std::string("{}")));
        REQUIRE_FALSE(std::filesystem::exists(dir.path / "crash-state.json"));
    }

    SECTION("Parent path is a regular file") {
        auto blocker = dir.path / "blocker";
        {
            std::ofstream f(blocker);
            f << "x";
        }
        REQUIRE_FALSE(atomic_write_file(blocker / "crash-state.json", std::string("{}")));
    }
}

TEST_CASE("read_file: missing files read as empty", "[atomic_write][read]") {
    ScratchDir dir("read");
    REQUIRE(read_file(dir.path / "absent.json").empty());
    REQUIRE(read_file_string(dir.path / "absent.json").empty());
}
