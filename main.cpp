// -----------------------------------------------------------------------------
// capguard_server: single executable entry point.
//
//   1) Parse flags: aggregate-state file, risk-config file, breach and
//      override store files, gateway endpoints, sweep interval.
//   2) Build the collaborators (file-backed state source and stores, the
//      TTL-cached config provider, the live clock).
//   3) Create the CapitalControlEngine and start it. The control gateway
//      serves commands on the REP endpoint and broadcasts audit records on
//      the PUB endpoint from its own thread.
//   4) Run the breach sweep and the controls sweep on the main thread every
//      sweep interval until Ctrl-C.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread     → periodic sweeps
//   gateway thread  → IpcServer command/telemetry loop
//
// Usage:
//   capguard_server [--state FILE] [--config FILE] [--breaches FILE]
//                   [--overrides FILE] [--cmd ENDPOINT] [--pub ENDPOINT]
//                   [--interval-ms N]
// -----------------------------------------------------------------------------

#include "capguard/config/risk_config_provider.hpp"
#include "capguard/domain/names.hpp"
#include "capguard/engine/capital_control_engine.hpp"
#include "capguard/state/json_file_state_source.hpp"
#include "capguard/store/json_file_breach_store.hpp"
#include "capguard/store/json_file_override_store.hpp"
#include "capguard/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set from the SIGINT handler, polled by the sweep loop.
std::atomic<bool> g_running{true};

struct ServerOptions {
  std::string state_path = "capital_state.json";
  std::string config_path = "risk_config.json";
  std::string breach_store_path = "breach_events.json";
  std::string override_store_path = "capital_overrides.json";
  std::string cmd_endpoint = "tcp://127.0.0.1:5556";
  std::string pub_endpoint = "tcp://127.0.0.1:5557";
  std::int64_t sweep_interval_ms = 60 * 1000;
};

constexpr std::int64_t kSleepSliceMs = 100;

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--state FILE] [--config FILE] [--breaches FILE]"
               " [--overrides FILE] [--cmd ENDPOINT] [--pub ENDPOINT]"
               " [--interval-ms N]\n";
}

// Returns false on an unknown flag or a missing value.
bool parseArgs(int argc, char** argv, ServerOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "[main] missing value for " << flag << "\n";
      return false;
    }
    const std::string value = argv[++i];
    if (flag == "--state") {
      opts.state_path = value;
    } else if (flag == "--config") {
      opts.config_path = value;
    } else if (flag == "--breaches") {
      opts.breach_store_path = value;
    } else if (flag == "--overrides") {
      opts.override_store_path = value;
    } else if (flag == "--cmd") {
      opts.cmd_endpoint = value;
    } else if (flag == "--pub") {
      opts.pub_endpoint = value;
    } else if (flag == "--interval-ms") {
      try {
        opts.sweep_interval_ms = std::stoll(value);
      } catch (const std::exception&) {
        std::cerr << "[main] --interval-ms expects an integer, got " << value
                  << "\n";
        return false;
      }
      if (opts.sweep_interval_ms <= 0) {
        std::cerr << "[main] --interval-ms must be positive\n";
        return false;
      }
    } else {
      std::cerr << "[main] unknown flag " << flag << "\n";
      return false;
    }
  }
  return true;
}

void sigint_handler(int /*signum*/) { g_running.store(false); }

void runSweeps(capguard::CapitalControlEngine& engine) {
  try {
    engine.runBreachSweep();
  } catch (const std::exception& e) {
    std::cerr << "[main] breach sweep failed: " << e.what() << "\n";
  }

  // Never throws: decision failures fail closed inside the engine.
  const auto controls = engine.runControlsSweep();
  std::cout << "[main] control mode "
            << capguard::domain::toString(controls.decision.mode) << ", "
            << controls.overrides.size() << " override(s)\n";
}

}  // namespace

int main(int argc, char** argv) {
  ServerOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    printUsage(argv[0]);
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Collaborators. All stack-local; the engine holds references.
  // -------------------------------------------------------------------------
  capguard::LiveTimeProvider clock;
  capguard::RiskConfigProvider config(std::filesystem::path(opts.config_path),
                                      clock);
  capguard::JsonFileStateSource state(opts.state_path);
  capguard::JsonFileBreachStore breaches(opts.breach_store_path);
  capguard::JsonFileOverrideStore overrides(opts.override_store_path);

  // -------------------------------------------------------------------------
  // 2) Engine and control gateway.
  // -------------------------------------------------------------------------
  capguard::CapitalControlEngine engine(state, breaches, overrides, config,
                                        clock, opts.cmd_endpoint,
                                        opts.pub_endpoint);
  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start control gateway: " << e.what()
              << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] state=" << opts.state_path
            << " config=" << opts.config_path
            << " sweep every " << opts.sweep_interval_ms << " ms\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 3) Sweep loop. Sleeps in short slices so Ctrl-C is honoured promptly.
  // -------------------------------------------------------------------------
  while (g_running.load()) {
    runSweeps(engine);

    for (std::int64_t slept = 0;
         slept < opts.sweep_interval_ms && g_running.load();
         slept += kSleepSliceMs) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kSleepSliceMs));
    }
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
