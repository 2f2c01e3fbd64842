/**
 * @file vigil-ingestd.cpp
 * @brief Ingestion daemon: HTTP API, storage and threshold alerting.
 *
 * Usage: vigil-ingestd <config.json>
 *
 * Serves POST /ingest, GET /health, GET /metrics and GET /summary until
 * SIGINT/SIGTERM. Exit codes: 0=clean shutdown, 1=bad config, 2=startup failure.
 */

#include "src/alert/inc/AlertDispatcher.hpp"
#include "src/alert/inc/AlertEngine.hpp"
#include "src/alert/inc/Channels.hpp"
#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/ingest/inc/HttpServer.hpp"
#include "src/ingest/inc/IngestApi.hpp"
#include "src/ingest/inc/IngestionService.hpp"
#include "src/storage/inc/StorageBackend.hpp"

#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace logging = vigil::helpers::logging;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

/// Time allowed for queued alert evaluations on shutdown.
constexpr std::chrono::milliseconds ALERT_DRAIN{3000};

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  if (argc != 2) {
    fmt::print(stderr, "Usage: {} <config.json>\n", argv[0]);
    return 1;
  }

  vigil::config::ServerSettings settings{};
  const vigil::config::ConfigResult CFG = vigil::config::loadServerConfig(argv[1], settings);
  if (!CFG.ok()) {
    fmt::print(stderr, "Error: {} ({})\n", CFG.reason, vigil::config::toString(CFG.status));
    return 1;
  }

  std::string error;
  if (!logging::init(settings.logging, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  auto log = logging::get("ingestd");

  std::unique_ptr<vigil::storage::StorageBackend> storage =
      vigil::storage::makeBackend(settings.storage, error);
  if (!storage) {
    log->critical("event=storage_config_failed reason=\"{}\"", error);
    return 1;
  }
  const vigil::storage::StorageResult OPENED = storage->open();
  if (!OPENED.ok()) {
    log->critical("event=storage_open_failed backend={} status={} reason=\"{}\"",
                  storage->name(), vigil::storage::toString(OPENED.status), OPENED.reason);
    return 2;
  }

  std::vector<std::unique_ptr<vigil::alert::NotificationChannel>> channels;
  if (vigil::alert::makeChannels(settings.channels, channels, error) !=
      vigil::alert::ChannelStatus::OK) {
    log->critical("event=channel_config_failed reason=\"{}\"", error);
    storage->close();
    return 1;
  }

  vigil::alert::AlertEngine engine(settings.thresholds, settings.recoveryEvents);
  vigil::alert::AlertDispatcher dispatcher(std::move(channels), settings.dispatcher);
  vigil::ingest::IngestionService service(*storage, &engine, &dispatcher);
  vigil::ingest::IngestApi api(service);
  vigil::ingest::HttpServer server(settings.server, api.handler());

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  if (!dispatcher.start()) {
    log->critical("event=dispatcher_start_failed");
    service.shutdown();
    return 2;
  }
  if (!server.start(error)) {
    log->critical("event=server_start_failed reason=\"{}\"", error);
    service.shutdown();
    dispatcher.stop();
    return 2;
  }
  log->info("event=ingestd_started bind={} port={} backend={} channels={}", settings.server.bind,
            server.port(), storage->name(), dispatcher.channelCount());

  while (g_running != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // Order: stop new requests, drain writes and close storage, then flush alerts.
  server.stop();
  if (!service.waitAlertsIdle(ALERT_DRAIN)) {
    log->warn("event=evaluation_drain_timeout timeout_ms={}", ALERT_DRAIN.count());
  }
  service.shutdown();
  if (!dispatcher.waitIdle(ALERT_DRAIN)) {
    log->warn("event=alert_drain_timeout timeout_ms={}", ALERT_DRAIN.count());
  }
  dispatcher.stop();

  const vigil::ingest::IngestStats STATS = service.stats();
  const vigil::alert::AlertEngine::Stats ALERTS = engine.stats();
  log->info("event=ingestd_stopped accepted={} duplicates={} rejected={} storage_failures={} "
            "alerts_fired={} alerts_suppressed={}",
            STATS.accepted, STATS.duplicates, STATS.rejected, STATS.storageFailures, ALERTS.fired,
            ALERTS.suppressed);
  spdlog::shutdown();
  return 0;
}
