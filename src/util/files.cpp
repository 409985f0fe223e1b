// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace rttfuzz {
namespace util {

namespace {

// Closes the descriptor on scope exit
class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) {
      close(fd_);
    }
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

bool sync_fd(int fd) {
#if defined(__APPLE__)
  // fsync() on macOS does not flush the drive cache
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool sync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  FdGuard fd(open(dir.c_str(), O_RDONLY));
#else
  FdGuard fd(open(dir.c_str(), O_RDONLY | O_DIRECTORY));
#endif
  if (fd.get() < 0) {
    return false;
  }
  return sync_fd(fd.get());
}

std::string temp_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
  return std::string(buf);
}

bool write_all(int fd, const std::vector<uint8_t>& data, const std::filesystem::path& where) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: write to {} failed after {}/{} bytes: {} (errno={})", where.string(), total,
                data.size(), std::strerror(errno), errno);
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create parent directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + temp_suffix();

  std::error_code ec;
  {
    // O_EXCL: never reuse a pre-existing temp file. O_NOFOLLOW: never write through a symlink.
    FdGuard fd(open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode));
    if (fd.get() < 0) {
      LOG_ERROR("atomic_write_file: cannot create {}: {} (errno={})", temp_path.string(), std::strerror(errno),
                errno);
      return false;
    }

    if (!write_all(fd.get(), data, temp_path)) {
      std::filesystem::remove(temp_path, ec);
      return false;
    }

    if (!sync_fd(fd.get())) {
      LOG_ERROR("atomic_write_file: fsync of {} failed: {} (errno={})", temp_path.string(), std::strerror(errno),
                errno);
      std::filesystem::remove(temp_path, ec);
      return false;
    }
  }

  if (!parent.empty() && !sync_directory(parent)) {
    LOG_ERROR("atomic_write_file: fsync of directory {} failed: {} (errno={})", parent.string(),
              std::strerror(errno), errno);
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
  return atomic_write_file(path, data, 0644);
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  return atomic_write_file(path, std::vector<uint8_t>(data.begin(), data.end()), mode);
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
  constexpr std::streamsize MAX_FILE_SIZE = 100 * 1024 * 1024;

  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    LOG_ERROR("read_file: cannot open {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    LOG_ERROR("read_file: cannot determine size of {}", path.string());
    return {};
  }

  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size > MAX_FILE_SIZE) {
    LOG_ERROR("read_file: {} is {} bytes, above the {} byte limit", path.string(), size, MAX_FILE_SIZE);
    return {};
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char*>(data.data()), size);
  if (!file) {
    LOG_ERROR("read_file: short read of {} ({} bytes expected)", path.string(), size);
    return {};
  }

  return data;
}

std::string read_file_string(const std::filesystem::path& path) {
  auto data = read_file(path);
  return std::string(data.begin(), data.end());
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

}  // namespace util
}  // namespace rttfuzz
