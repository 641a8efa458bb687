/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Directory, read and atomic-write helpers over POSIX calls
 *
 *          - Time formatting utilities
 */

#include "hls_variants/system.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

namespace hls_variants {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Write the whole buffer, retrying on short writes and EINTR
bool write_all(int fd, const char *data, size_t size) {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !quota_str.empty() && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  if (limit <= 0)
    limit = 1;
  return limit;
}

// **---- File Utilities ----**

bool ensure_directory(const std::string &path, std::string &error) {
  std::error_code ec;
  if (fs::is_directory(path, ec))
    return true;

  fs::create_directories(path, ec);
  if (ec) {
    error = fmt::format("cannot create directory {}: {}", path, ec.message());
    return false;
  }
  if (!fs::is_directory(path, ec)) {
    error = fmt::format("cannot create directory {}: not a directory", path);
    return false;
  }
  return true;
}

bool read_text_file(const std::string &path, std::string &content,
                    std::string &error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = fmt::format("cannot open {}: {}", path, std::strerror(errno));
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    error = fmt::format("cannot read {}", path);
    return false;
  }
  content = ss.str();
  return true;
}

bool write_file_atomic(const std::string &path, const std::string &content,
                       std::string &error) {
  std::string tmp_path = path + ".tmp";

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  0644);
  if (fd == -1) {
    error = fmt::format("cannot create {}: {}", tmp_path, std::strerror(errno));
    return false;
  }

  if (!write_all(fd, content.data(), content.size()) || ::fsync(fd) != 0) {
    error = fmt::format("cannot write {}: {}", tmp_path, std::strerror(errno));
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return false;
  }

  if (::close(fd) != 0) {
    error = fmt::format("cannot close {}: {}", tmp_path, std::strerror(errno));
    ::unlink(tmp_path.c_str());
    return false;
  }

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    error = fmt::format("cannot rename {} to {}: {}", tmp_path, path,
                        std::strerror(errno));
    ::unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

bool publish_file(const std::string &from, const std::string &to,
                  std::string &error) {
  int fd = ::open(from.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    error = fmt::format("cannot open {}: {}", from, std::strerror(errno));
    return false;
  }
  if (::fsync(fd) != 0) {
    error = fmt::format("cannot sync {}: {}", from, std::strerror(errno));
    ::close(fd);
    return false;
  }
  if (::close(fd) != 0) {
    error = fmt::format("cannot close {}: {}", from, std::strerror(errno));
    return false;
  }

  if (::rename(from.c_str(), to.c_str()) != 0) {
    error = fmt::format("cannot rename {} to {}: {}", from, to,
                        std::strerror(errno));
    return false;
  }
  return true;
}

bool remove_if_exists(const std::string &path, std::string &error) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    error = fmt::format("cannot remove {}: {}", path, ec.message());
    return false;
  }
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace hls_variants
