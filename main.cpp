// -----------------------------------------------------------------------------
// stratexec_server — single executable entry point.
//
// Usage: stratexec_server [config.json]
//   (or set STRATEXEC_CONFIG_FILE; without either, built-in defaults apply)
//
//   1) Load ServiceConfig (file, then environment overrides).
//   2) Build the ConfigLookupService over the descriptor search path.
//      Load the trade calendar when one is configured.
//   3) Register the built-in strategies.
//   4) Create the ExecutionGateway and the CommandHandler in front of it.
//   5) Start the RpcServer (ZeroMQ ROUTER + worker pool).
//   6) Wait for SIGINT / SIGTERM, then shut down cleanly.
//   7) Give abandoned strategy runners kRunnerDrainTimeout to finish. If
//      one is still running, leave with std::_Exit(): the runner still uses
//      the lookup, the registry and the gateway, so their destructors must
//      not run.
//
// Thread layout:
//   main thread     → setup, then sleeps until a signal arrives
//   rpc io thread   → RpcServer socket loop
//   rpc workers     → CommandHandler / ExecutionGateway::exec(), at most
//                     one worker per (account, strategy) pair
//   runner threads  → one per strategy call, owned by the gateway
//
// Everything is stack-local in main(); the components borrow each other by
// reference, so the declaration order below is also the teardown order.
// -----------------------------------------------------------------------------

#include "stratexec/config/config_lookup_service.hpp"
#include "stratexec/config/service_config.hpp"
#include "stratexec/engine/command_handler.hpp"
#include "stratexec/engine/execution_gateway.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/network/rpc_server.hpp"
#include "stratexec/strategy/dual_ma_strategy.hpp"
#include "stratexec/strategy/strategy_registry.hpp"
#include "stratexec/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. The handler only stores to it; the
// main thread polls it and performs the actual shutdown.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static constexpr std::chrono::seconds kRunnerDrainTimeout{5};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  std::string config_path;
  if (argc > 1) {
    config_path = argv[1];
  } else if (const char* env = std::getenv("STRATEXEC_CONFIG_FILE")) {
    config_path = env;
  }

  stratexec::ServiceConfig config;
  try {
    config = stratexec::loadServiceConfig(config_path);
  } catch (const stratexec::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Descriptor lookup.
  // -------------------------------------------------------------------------
  stratexec::ConfigLookupService lookup(config.descriptorSearchPath());

  // -------------------------------------------------------------------------
  // 3) Strategies.
  // -------------------------------------------------------------------------
  stratexec::StrategyRegistry registry;
  registry.add("dual_ma",
               [] { return std::make_unique<stratexec::DualMaStrategy>(); });

  // -------------------------------------------------------------------------
  // 4) Gateway.
  // -------------------------------------------------------------------------
  stratexec::LiveTimeProvider clock;

  stratexec::GatewayOptions options;
  options.default_strategy = config.default_strategy;
  options.timeout_grace = config.timeout_grace;
  options.dedup_retention = config.dedup_retention;
  options.dedup_max_entries = config.dedup_max_entries;
  if (!config.trade_calendar_file.empty()) {
    try {
      options.trade_calendar = std::make_shared<const stratexec::TradeCalendar>(
          stratexec::TradeCalendar::load(config.trade_calendar_file));
    } catch (const stratexec::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  stratexec::ExecutionGateway gateway(registry, lookup, clock, options);
  stratexec::CommandHandler handler(gateway);

  // -------------------------------------------------------------------------
  // 5) RPC server.
  // -------------------------------------------------------------------------
  stratexec::RpcServer server(
      [&handler](const std::string& payload) {
        return handler.execute(payload);
      },
      [&handler](const std::string& payload) {
        return handler.routingKey(payload);
      },
      config.endpoint, config.worker_threads);

  try {
    server.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind " << config.endpoint << ": " << e.what()
              << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 6) Run until SIGINT / SIGTERM.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] stratexec_server listening on " << config.endpoint
            << ". Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Signal received. Shutting down...\n";
  server.stop();

  // -------------------------------------------------------------------------
  // 7) Abandoned runners.
  // -------------------------------------------------------------------------
  if (!gateway.waitForAbandonedRunners(kRunnerDrainTimeout)) {
    std::cerr << "[main] WARNING: " << gateway.abandonedRunners()
              << " abandoned strategy runner(s) still running after "
              << kRunnerDrainTimeout.count()
              << "s; exiting without teardown.\n";
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(EXIT_FAILURE);
  }

  std::cout << "[main] Stopped.\n";
  return 0;
}
