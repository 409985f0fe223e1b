// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rttfuzz {
namespace util {

// Write data to path atomically: temp file in the same directory, fsync,
// directory fsync, rename over the target. Creates parent directories.
// Returns false (and logs) on any failure; the target is left untouched.
bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Read whole file. Returns empty vector on failure or if the file exceeds 100MB.
std::vector<uint8_t> read_file(const std::filesystem::path& path);

std::string read_file_string(const std::filesystem::path& path);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

}  // namespace util
}  // namespace rttfuzz
