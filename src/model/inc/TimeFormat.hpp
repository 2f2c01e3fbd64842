#ifndef VIGIL_MODEL_TIME_FORMAT_HPP
#define VIGIL_MODEL_TIME_FORMAT_HPP
/**
 * @file TimeFormat.hpp
 * @brief ISO-8601 UTC timestamps at millisecond precision.
 *
 * Output form: "2024-05-01T12:00:00.250Z". Input accepts an optional fraction
 * (any number of digits, truncated to ms) and a "Z", "+hh:mm" / "-hh:mm" or
 * absent zone designator; absent means UTC.
 */

#include "src/model/inc/MetricSnapshot.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vigil {

namespace model {

/// @brief Render as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string formatIso8601(Timestamp t);

/**
 * @brief Parse an ISO-8601 date-time.
 * @return Instant in UTC, or std::nullopt on malformed input.
 */
[[nodiscard]] std::optional<Timestamp> parseIso8601(std::string_view text) noexcept;

} // namespace model

} // namespace vigil

#endif // VIGIL_MODEL_TIME_FORMAT_HPP
