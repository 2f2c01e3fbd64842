/**
 * @file vigil-agent.cpp
 * @brief Host collector: samples local metrics and ships them to vigil-ingestd.
 *
 * Usage: vigil-agent <config.json>
 *
 * Runs until SIGINT/SIGTERM. Exit codes: 0=clean shutdown, 1=bad config,
 * 2=startup failure.
 */

#include "src/collect/inc/HostCollector.hpp"
#include "src/collect/inc/Sampler.hpp"
#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/transport/inc/TransmissionClient.hpp"

#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace logging = vigil::helpers::logging;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  if (argc != 2) {
    fmt::print(stderr, "Usage: {} <config.json>\n", argv[0]);
    return 1;
  }

  vigil::config::AgentSettings settings{};
  const vigil::config::ConfigResult CFG = vigil::config::loadAgentConfig(argv[1], settings);
  if (!CFG.ok()) {
    fmt::print(stderr, "Error: {} ({})\n", CFG.reason, vigil::config::toString(CFG.status));
    return 1;
  }

  std::string error;
  if (!logging::init(settings.logging, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  auto log = logging::get("agent");

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  vigil::collect::HostCollector collector(settings.hostname, settings.paths);
  vigil::transport::HttpIngestTransport transport(settings.endpointUrl, settings.endpointTimeout,
                                                  settings.verifyTls);
  vigil::transport::TransmissionClient client(transport, settings.transmission);
  vigil::collect::Sampler sampler(collector, client, settings.interval);

  if (!client.start() || !sampler.start()) {
    log->critical("event=agent_start_failed");
    client.stop();
    return 2;
  }
  log->info("event=agent_started host={} endpoint={} interval_ms={}", settings.hostname,
            settings.endpointUrl, settings.interval.count());

  while (g_running != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // Timer first so nothing new reaches the client.
  sampler.stop();
  client.stop();

  const vigil::transport::TransmissionStats STATS = client.stats();
  log->info("event=agent_stopped ticks={} missed={} delivered={} rejected={} exhausted={} "
            "dropped={} cancelled={}",
            sampler.ticks(), sampler.missedTicks(), STATS.delivered, STATS.rejected,
            STATS.exhausted, STATS.overflowDropped, STATS.cancelled);
  spdlog::shutdown();
  return 0;
}
