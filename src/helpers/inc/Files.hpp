#ifndef VIGIL_HELPERS_FILES_HPP
#define VIGIL_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File reading and path utilities for procfs/sysfs collectors.
 *
 * Collectors read small pseudo-files whose root can be rebased (e.g. a
 * container mounting the host's /proc at /host/proc), so every reader takes a
 * root directory plus a relative path.
 *
 * @note Small reads use open/read/close into caller buffers. Whole-file reads
 *       allocate and are intended for the sampling thread only.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, close

#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtoull
#include <optional>
#include <string>
#include <string_view>

namespace vigil {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Size for small integer file reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/// Upper bound for whole-file reads (procfs files never approach this).
inline constexpr std::size_t MAX_TEXT_FILE_SIZE = 4 * 1024 * 1024;

/* ----------------------------- Paths ----------------------------- */

/**
 * @brief Join a root directory and a relative path with exactly one separator.
 * @param root Root directory (e.g. "/proc", "/host/proc/").
 * @param rel Relative path (e.g. "meminfo", "/meminfo").
 * @return Joined path.
 */
[[nodiscard]] inline std::string joinPath(std::string_view root, std::string_view rel) {
  while (root.size() > 1 && root.back() == '/') {
    root.remove_suffix(1);
  }
  while (!rel.empty() && rel.front() == '/') {
    rel.remove_prefix(1);
  }

  std::string out(root);
  if (rel.empty()) {
    return out;
  }
  if (out.empty() || out.back() != '/') {
    out.push_back('/');
  }
  out.append(rel);
  return out;
}

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  vigil::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Read unsigned 64-bit integer from file.
 * @param path File path to read.
 * @param defaultVal Value to return on error.
 * @return Parsed integer or defaultVal on failure.
 */
[[nodiscard]] inline std::uint64_t readFileUint64(const char* path,
                                                  std::uint64_t defaultVal = 0) noexcept {
  char buf[INT_READ_BUFFER_SIZE];
  if (readFileToBuffer(path, buf, sizeof(buf)) == 0) {
    return defaultVal;
  }

  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(buf, &end, 10);
  if (end == buf) {
    return defaultVal;
  }

  return static_cast<std::uint64_t>(VAL);
}

/**
 * @brief Read a whole text file.
 * @param path File path to read.
 * @return File contents, or std::nullopt if the file cannot be opened or read.
 * @note Allocates. procfs files report size 0, so the read loops until EOF.
 */
[[nodiscard]] inline std::optional<std::string> readTextFile(const std::string& path) {
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return std::nullopt;
  }

  std::string out;
  char chunk[4096];
  bool failed = false;
  while (out.size() < MAX_TEXT_FILE_SIZE) {
    const ssize_t N = ::read(FD, chunk, sizeof(chunk));
    if (N < 0) {
      failed = true;
      break;
    }
    if (N == 0) {
      break;
    }
    out.append(chunk, static_cast<std::size_t>(N));
  }

  ::close(FD);
  if (failed) {
    return std::nullopt;
  }
  return out;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path is a directory.
 * @param path Path to check.
 * @return true if path exists and is a directory.
 */
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace vigil

#endif // VIGIL_HELPERS_FILES_HPP
