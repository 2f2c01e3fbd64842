#ifndef VIGIL_MODEL_SNAPSHOT_JSON_HPP
#define VIGIL_MODEL_SNAPSHOT_JSON_HPP
/**
 * @file SnapshotJson.hpp
 * @brief JSON wire format for snapshots, ingest payloads and alert events (jsoncpp).
 *
 * Ingest body:
 * @code
 * {"hostname": "h1",
 *  "metrics": {"timestamp": "2024-05-01T12:00:00.000Z",
 *              "cpu": {"overall_percent": 12.5, "per_core_percent": [..],
 *                      "load_avg": [0.5, 0.4, 0.3], "core_count_logical": 8},
 *              "memory": {"total_bytes": .., "used_bytes": .., "free_bytes": ..,
 *                         "available_bytes": .., "buffers_bytes": .., "cached_bytes": ..,
 *                         "percent_used": ..},
 *              "swap": {"total_bytes": .., "used_bytes": .., "free_bytes": .., "percent_used": ..},
 *              "disk": {"filesystems": [{"mount_point": "/", "device": .., "filesystem_type": ..,
 *                                        "total_bytes": .., "used_bytes": .., "free_bytes": ..,
 *                                        "percent_used": ..}]},
 *              "network": {"bytes_sent": .., "bytes_recv": .., "packets_sent": ..,
 *                          "packets_recv": .., "errors_in": .., "errors_out": ..,
 *                          "drops_in": .., "drops_out": ..}}}
 * @endcode
 *
 * Decoding is lenient about absent metric groups and fields (they stay zero)
 * and strict about types: a string where a number is expected is MALFORMED.
 * "disk" may also be a bare array of filesystems.
 */

#include "src/model/inc/AlertTypes.hpp"
#include "src/model/inc/MetricSnapshot.hpp"
#include "src/model/inc/Validation.hpp"

#include <json/json.h>

#include <string>
#include <string_view>

namespace vigil {

namespace model {

/* ----------------------------- Encoding ----------------------------- */

/// @brief Snapshot as a "metrics" object (includes hostname and timestamp).
[[nodiscard]] Json::Value snapshotToJson(const MetricSnapshot& snap);

/// @brief Full ingest body {"hostname", "metrics"}.
[[nodiscard]] Json::Value ingestPayloadToJson(const MetricSnapshot& snap);

/// @brief Alert event as sent to webhook channels.
[[nodiscard]] Json::Value alertEventToJson(const AlertEvent& event);

/// @brief Serialize without whitespace.
[[nodiscard]] std::string toCompactString(const Json::Value& value);

/* ----------------------------- Decoding ----------------------------- */

/**
 * @brief Parse JSON text.
 * @param text Raw document.
 * @param out Parsed value.
 * @param error Parser message on failure.
 * @return true on success.
 */
[[nodiscard]] bool parseJson(std::string_view text, Json::Value& out, std::string& error);

/**
 * @brief Decode a "metrics" object.
 * @param value Object as produced by snapshotToJson.
 * @param out Decoded snapshot; hostname is taken from the object when present.
 * @return OK, MALFORMED on type errors, OUT_OF_RANGE on negative byte counts,
 *         MISSING_FIELD when the timestamp is absent.
 */
[[nodiscard]] ValidationResult snapshotFromJson(const Json::Value& value, MetricSnapshot& out);

/**
 * @brief Decode an ingest body.
 *
 * The outer "hostname" is authoritative; an inner metrics.hostname that
 * disagrees with it is MALFORMED.
 */
[[nodiscard]] ValidationResult ingestPayloadFromJson(std::string_view body, MetricSnapshot& out);

} // namespace model

} // namespace vigil

#endif // VIGIL_MODEL_SNAPSHOT_JSON_HPP
