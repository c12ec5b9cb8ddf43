#include "stratexec/config/service_config.hpp"

#include "stratexec/errors/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace stratexec {

namespace fs = std::filesystem;

namespace {

fs::path homeDirectory() {
  const char* home = std::getenv("HOME");
  return home != nullptr ? fs::path(home) : fs::path();
}

fs::path expandHome(const std::string& text) {
  if (text.rfind("~/", 0) == 0) {
    fs::path home = homeDirectory();
    if (!home.empty()) {
      return home / text.substr(2);
    }
  }
  return fs::path(text);
}

std::size_t positiveCount(const std::string& text, const char* what) {
  try {
    std::size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size() || value <= 0) {
      throw ConfigError(std::string(what) + " must be a positive integer");
    }
    return static_cast<std::size_t>(value);
  } catch (const std::logic_error&) {
    throw ConfigError(std::string(what) + " must be a positive integer, got '" +
                      text + "'");
  }
}

// -----------------------------------------------------------------------------
// applyJson(): copy recognised keys from the file into config
// -----------------------------------------------------------------------------
void applyJson(const nlohmann::json& doc, ServiceConfig& config) {
  if (!doc.is_object()) {
    throw ConfigError("service config must be a JSON object");
  }
  try {
    if (doc.contains("endpoint")) {
      config.endpoint = doc.at("endpoint").get<std::string>();
    }
    if (doc.contains("worker_threads")) {
      auto workers = doc.at("worker_threads").get<std::int64_t>();
      if (workers <= 0) {
        throw ConfigError("worker_threads must be positive");
      }
      config.worker_threads = static_cast<std::size_t>(workers);
    }
    if (doc.contains("dedup_retention_ms")) {
      auto ms = doc.at("dedup_retention_ms").get<std::int64_t>();
      if (ms <= 0) {
        throw ConfigError("dedup_retention_ms must be positive");
      }
      config.dedup_retention = std::chrono::milliseconds(ms);
    }
    if (doc.contains("dedup_max_entries")) {
      auto entries = doc.at("dedup_max_entries").get<std::int64_t>();
      if (entries <= 0) {
        throw ConfigError("dedup_max_entries must be positive");
      }
      config.dedup_max_entries = static_cast<std::size_t>(entries);
    }
    if (doc.contains("timeout_grace_ms")) {
      auto ms = doc.at("timeout_grace_ms").get<std::int64_t>();
      if (ms < 0) {
        throw ConfigError("timeout_grace_ms must not be negative");
      }
      config.timeout_grace = std::chrono::milliseconds(ms);
    }
    if (doc.contains("default_strategy")) {
      config.default_strategy = doc.at("default_strategy").get<std::string>();
    }
    if (doc.contains("trade_calendar")) {
      config.trade_calendar_file =
          expandHome(doc.at("trade_calendar").get<std::string>());
    }
    if (doc.contains("descriptor_dirs")) {
      const auto& dirs = doc.at("descriptor_dirs");
      if (dirs.contains("override")) {
        config.descriptor_override_dir =
            expandHome(dirs.at("override").get<std::string>());
      }
      if (dirs.contains("project")) {
        config.descriptor_project_dir =
            expandHome(dirs.at("project").get<std::string>());
      }
      if (dirs.contains("home")) {
        config.descriptor_home_dir =
            expandHome(dirs.at("home").get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid service config value: ") +
                      e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// descriptorSearchPath()
// -----------------------------------------------------------------------------
std::vector<fs::path> ServiceConfig::descriptorSearchPath() const {
  std::vector<fs::path> path;
  for (const auto& dir : {descriptor_override_dir, descriptor_project_dir,
                          descriptor_home_dir}) {
    if (!dir.empty()) {
      path.push_back(dir);
    }
  }
  return path;
}

// -----------------------------------------------------------------------------
// loadServiceConfig(): defaults → JSON file → environment
// -----------------------------------------------------------------------------
ServiceConfig loadServiceConfig(const fs::path& path) {
  ServiceConfig config;

  fs::path home = homeDirectory();
  if (!home.empty()) {
    config.descriptor_home_dir = home / ".stratexec" / "exchanges";
  }

  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) {
      throw ConfigError("cannot open service config " + path.string());
    }
    nlohmann::json doc;
    try {
      doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigError("invalid JSON in " + path.string() + ": " + e.what());
    }
    applyJson(doc, config);
    std::cout << "[ServiceConfig] loaded " << path << "\n";
  }

  if (const char* endpoint = std::getenv("STRATEXEC_ENDPOINT")) {
    config.endpoint = endpoint;
  }
  if (const char* workers = std::getenv("STRATEXEC_WORKERS")) {
    config.worker_threads = positiveCount(workers, "STRATEXEC_WORKERS");
  }
  if (const char* dir = std::getenv("STRATEXEC_CONFIG_DIR")) {
    config.descriptor_override_dir = expandHome(dir);
  }
  if (const char* calendar = std::getenv("STRATEXEC_TRADE_CALENDAR")) {
    config.trade_calendar_file = expandHome(calendar);
  }

  return config;
}

}  // namespace stratexec
