#ifndef VIGIL_INGEST_INGEST_API_HPP
#define VIGIL_INGEST_INGEST_API_HPP
/**
 * @file IngestApi.hpp
 * @brief HTTP routes of the ingestion daemon.
 *
 *  POST /ingest   {"hostname", "metrics"} -> 202 accepted | 400 rejected | 503 unavailable
 *  GET  /health   200 {"status":"ok"} while storage is reachable, else 503
 *  GET  /metrics  ?host=&since=&until=&limit= -> stored snapshots, oldest first
 *  GET  /summary  same filter -> {"samples","avg_cpu","max_cpu","avg_memory","max_memory"}
 *
 * since/until accept ISO-8601 or Unix milliseconds and are inclusive.
 */

#include "src/ingest/inc/HttpServer.hpp"
#include "src/ingest/inc/IngestionService.hpp"
#include "src/storage/inc/StorageBackend.hpp"

#include <string>
#include <string_view>

namespace vigil {

namespace ingest {

/**
 * @brief Parse host/since/until/limit from a query string.
 * @param reason Names the bad parameter on failure.
 */
[[nodiscard]] bool parseQueryFilter(std::string_view query, storage::QueryFilter& out,
                                    std::string& reason);

class IngestApi {
public:
  explicit IngestApi(IngestionService& service) : service_(service) {}

  /// @brief Route one request.
  [[nodiscard]] ServerReply handle(const ServerRequest& req);

  /// @brief Adapter for HttpServer.
  [[nodiscard]] RequestHandler handler() {
    return [this](const ServerRequest& req) { return handle(req); };
  }

private:
  ServerReply postIngest(const ServerRequest& req);
  ServerReply getHealth();
  ServerReply getMetrics(const ServerRequest& req);
  ServerReply getSummary(const ServerRequest& req);

  IngestionService& service_;
};

} // namespace ingest

} // namespace vigil

#endif // VIGIL_INGEST_INGEST_API_HPP
