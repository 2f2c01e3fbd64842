#ifndef VIGIL_HELPERS_STRINGS_HPP
#define VIGIL_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Tokenizing and numeric parsing helpers for procfs text and wire fields.
 *
 * @note All functions are noexcept except those returning containers.
 */

#include <cctype>  // std::tolower
#include <cerrno>  // errno, ERANGE
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtod, strtoull
#include <cstring> // strlen
#include <string>
#include <string_view>

namespace vigil {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Remove leading and trailing whitespace from a view.
 */
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' ||
                        s.front() == '\n')) {
    s.remove_prefix(1);
  }
  while (!s.empty() &&
         (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
    s.remove_suffix(1);
  }
  return s;
}

/**
 * @brief Iterate lines of a text blob, calling fn(std::string_view) for each.
 */
template <typename Fn> inline void forEachLine(std::string_view text, Fn&& fn) {
  while (!text.empty()) {
    const std::size_t EOL = text.find('\n');
    const std::string_view LINE = text.substr(0, EOL);
    fn(LINE);
    if (EOL == std::string_view::npos) {
      break;
    }
    text.remove_prefix(EOL + 1);
  }
}

/**
 * @brief Parse an unsigned decimal integer occupying the whole view.
 * @param s Digits.
 * @param out Parsed value (unchanged on failure).
 * @return true on success.
 */
[[nodiscard]] inline bool parseUint64(std::string_view s, std::uint64_t& out) noexcept {
  if (s.empty() || s.size() > 20) {
    return false;
  }
  std::uint64_t val = 0;
  for (const char C : s) {
    if (C < '0' || C > '9') {
      return false;
    }
    const std::uint64_t DIGIT = static_cast<std::uint64_t>(C - '0');
    if (val > (UINT64_MAX - DIGIT) / 10) {
      return false;
    }
    val = val * 10 + DIGIT;
  }
  out = val;
  return true;
}

/**
 * @brief Parse a floating point number occupying the whole view.
 * @param s Text (e.g. "0.52", "1e3").
 * @param out Parsed value (unchanged on failure).
 * @return true on success.
 */
[[nodiscard]] inline bool parseDouble(std::string_view s, double& out) noexcept {
  if (s.empty() || s.size() >= 64) {
    return false;
  }
  char buf[64];
  for (std::size_t i = 0; i < s.size(); ++i) {
    buf[i] = s[i];
  }
  buf[s.size()] = '\0';

  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(buf, &end);
  if (end != buf + s.size() || errno == ERANGE) {
    return false;
  }
  out = VAL;
  return true;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/**
 * @brief Decode the octal escapes the kernel uses in /proc/mounts ("\040" for space).
 */
[[nodiscard]] inline std::string unescapeOctal(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() && s[i + 1] >= '0' && s[i + 1] <= '3' &&
        s[i + 2] >= '0' && s[i + 2] <= '7' && s[i + 3] >= '0' && s[i + 3] <= '7') {
      out.push_back(static_cast<char>((s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 +
                                      (s[i + 3] - '0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

/**
 * @brief ASCII lower-case copy.
 */
[[nodiscard]] inline std::string toLower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/**
 * @brief Check if string starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace strings
} // namespace helpers
} // namespace vigil

#endif // VIGIL_HELPERS_STRINGS_HPP
