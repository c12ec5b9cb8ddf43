#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace stratexec {

// -----------------------------------------------------------------------------
// ServiceConfig — process-wide settings of the execution service
// -----------------------------------------------------------------------------
//
// @brief  Plain settings struct with working defaults, optionally
//         overridden from a JSON file and from environment variables.
//
// @details
// JSON keys (all optional):
//
//   {
//     "endpoint": "tcp://127.0.0.1:5560",
//     "worker_threads": 4,
//     "dedup_retention_ms": 600000,
//     "dedup_max_entries": 10000,
//     "timeout_grace_ms": 200,
//     "default_strategy": "dual_ma",
//     "trade_calendar": "./config/trade_calendar.json",
//     "descriptor_dirs": {
//       "override": "/etc/stratexec/exchanges",
//       "project": "./config/exchanges",
//       "home": "~/.stratexec/exchanges"
//     }
//   }
//
// Environment overrides (applied after the file):
//   STRATEXEC_ENDPOINT, STRATEXEC_WORKERS, STRATEXEC_CONFIG_DIR
//   (the override descriptor location), STRATEXEC_TRADE_CALENDAR.
//
// Thread model:
//   Plain data struct with value semantics. Copied into components at
//   construction; never mutated afterwards.
// -----------------------------------------------------------------------------
struct ServiceConfig {
  std::string endpoint{"tcp://127.0.0.1:5560"};
  std::size_t worker_threads{4};

  // DedupCache: how long and how many responses are remembered.
  std::chrono::milliseconds dedup_retention{std::chrono::minutes(10)};
  std::size_t dedup_max_entries{10000};

  // How long a timed-out call may keep its pair's token while it winds down.
  std::chrono::milliseconds timeout_grace{200};

  // Strategy used when a request names none.
  std::string default_strategy{"dual_ma"};

  // TradeCalendar JSON; empty means the built-in weekend-only calendar.
  std::filesystem::path trade_calendar_file;

  std::filesystem::path descriptor_override_dir;
  std::filesystem::path descriptor_project_dir{"config/exchanges"};
  std::filesystem::path descriptor_home_dir;

  // -------------------------------------------------------------------------
  // descriptorSearchPath()
  // -------------------------------------------------------------------------
  // @return The non-empty descriptor locations in priority order:
  //         override, project-local, home.
  // -------------------------------------------------------------------------
  std::vector<std::filesystem::path> descriptorSearchPath() const;
};

// -----------------------------------------------------------------------------
// loadServiceConfig(path)
// -----------------------------------------------------------------------------
//
// @brief  Builds a ServiceConfig from defaults, an optional JSON file, and
//         the environment.
//
// @param  path  JSON file to read. Empty means "no file"; a non-empty path
//               that cannot be read is an error.
//
// @details
// The home location defaults to $HOME/.stratexec/exchanges when HOME is
// set. A leading "~/" in any descriptor directory is expanded the same way.
//
// @throws ConfigError on unreadable files, invalid JSON, wrong value types,
//         or out-of-range values (zero workers, zero retention).
// -----------------------------------------------------------------------------
ServiceConfig loadServiceConfig(const std::filesystem::path& path);

}  // namespace stratexec
