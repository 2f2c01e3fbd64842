/**
 * @file TimeFormat.cpp
 * @brief ISO-8601 formatting and parsing.
 */

#include "src/model/inc/TimeFormat.hpp"

#include <fmt/core.h>

#include <ctime> // gmtime_r, timegm

namespace vigil {

namespace model {

namespace {

/// Parse exactly `n` digits at text[pos], advancing pos.
bool takeDigits(std::string_view text, std::size_t& pos, std::size_t n, int& out) noexcept {
  if (pos + n > text.size()) {
    return false;
  }
  int v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char C = text[pos + i];
    if (C < '0' || C > '9') {
      return false;
    }
    v = v * 10 + (C - '0');
  }
  pos += n;
  out = v;
  return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) noexcept {
  if (pos < text.size() && text[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::string formatIso8601(Timestamp t) {
  const std::int64_t MS = t.time_since_epoch().count();
  std::int64_t secs = MS / 1000;
  std::int64_t frac = MS % 1000;
  if (frac < 0) {
    frac += 1000;
    --secs;
  }

  const std::time_t TT = static_cast<std::time_t>(secs);
  struct tm tmv{};
  ::gmtime_r(&TT, &tmv);

  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tmv.tm_year + 1900,
                     tmv.tm_mon + 1, tmv.tm_mday, tmv.tm_hour, tmv.tm_min, tmv.tm_sec,
                     static_cast<int>(frac));
}

std::optional<Timestamp> parseIso8601(std::string_view text) noexcept {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;

  if (!takeDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !takeDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !takeDigits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (!expect(text, pos, 'T') && !expect(text, pos, 't') && !expect(text, pos, ' ')) {
    return std::nullopt;
  }
  if (!takeDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !takeDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !takeDigits(text, pos, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return std::nullopt;
  }

  int millis = 0;
  if (expect(text, pos, '.')) {
    int scale = 100;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      return std::nullopt;
    }
  }

  int offsetMinutes = 0;
  if (pos < text.size()) {
    const char Z = text[pos];
    if (Z == 'Z' || Z == 'z') {
      ++pos;
    } else if (Z == '+' || Z == '-') {
      ++pos;
      int oh = 0;
      int om = 0;
      if (!takeDigits(text, pos, 2, oh)) {
        return std::nullopt;
      }
      expect(text, pos, ':');
      if (!takeDigits(text, pos, 2, om) || oh > 23 || om > 59) {
        return std::nullopt;
      }
      offsetMinutes = (Z == '+' ? 1 : -1) * (oh * 60 + om);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  struct tm tmv{};
  tmv.tm_year = year - 1900;
  tmv.tm_mon = month - 1;
  tmv.tm_mday = day;
  tmv.tm_hour = hour;
  tmv.tm_min = minute;
  tmv.tm_sec = second;
  const std::time_t SECS = ::timegm(&tmv);

  const std::int64_t MS = (static_cast<std::int64_t>(SECS) - offsetMinutes * 60LL) * 1000LL + millis;
  return vigil::helpers::clock::fromUnixMillis(MS);
}

} // namespace model

} // namespace vigil
