#ifndef VIGIL_MODEL_VALIDATION_HPP
#define VIGIL_MODEL_VALIDATION_HPP
/**
 * @file Validation.hpp
 * @brief Structural and range checks applied to snapshots before they are stored.
 */

#include "src/model/inc/MetricSnapshot.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace vigil {

namespace model {

/* ----------------------------- ValidationStatus ----------------------------- */

/**
 * @brief Why a snapshot was refused.
 */
enum class ValidationStatus : std::uint8_t {
  OK = 0,
  MISSING_FIELD, ///< hostname or timestamp absent
  OUT_OF_RANGE,  ///< percentage outside [0, 100], non-finite or negative value
  INCONSISTENT,  ///< used + free > total, duplicate mount point
  MALFORMED,     ///< not decodable (bad JSON, wrong field type), control characters in names
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ValidationStatus status) noexcept;

/**
 * @brief Validation outcome with a reason naming the offending field.
 */
struct ValidationResult {
  ValidationStatus status{ValidationStatus::OK};
  std::string reason{};

  [[nodiscard]] bool ok() const noexcept { return status == ValidationStatus::OK; }
};

/* ----------------------------- API ----------------------------- */

/// @brief True if @p text holds an ASCII control character (below 0x20, or DEL).
[[nodiscard]] bool hasControlChars(std::string_view text) noexcept;

/**
 * @brief Check required fields, numeric ranges and byte-count consistency.
 * @param snap Snapshot to check.
 * @return OK, or the first violation found with a reason such as
 *         "cpu.per_core_percent[3] = 104.2 not in [0, 100]".
 */
[[nodiscard]] ValidationResult validateSnapshot(const MetricSnapshot& snap);

} // namespace model

} // namespace vigil

#endif // VIGIL_MODEL_VALIDATION_HPP
