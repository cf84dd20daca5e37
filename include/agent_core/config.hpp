#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace agent_core {

class OrchestratorConfig {
 public:
  // Terminal tasks kept for observers; the oldest entry is evicted first.
  int history_limit = 50;
  // Period of the "updated" re-emission for the running task. 0 disables it.
  int status_heartbeat_ms = 500;
  std::string default_cancel_reason = "Cancelled by user";
  // When false, queued tasks only run through an explicit start().
  bool auto_dispatch = true;

  // Load configuration from a JSON file at the given path
  static OrchestratorConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static OrchestratorConfig from_json(const nlohmann::json& json_config) {
    OrchestratorConfig config;
    if (!json_config.is_object()) {
      throw std::runtime_error("Orchestrator configuration must be a JSON object");
    }

    config.history_limit = int_or_default(json_config, "history_limit", config.history_limit);
    config.status_heartbeat_ms =
        int_or_default(json_config, "status_heartbeat_ms", config.status_heartbeat_ms);

    if (json_config.contains("default_cancel_reason") &&
        json_config.at("default_cancel_reason").is_string()) {
      config.default_cancel_reason = json_config.at("default_cancel_reason").get<std::string>();
    }
    if (json_config.contains("auto_dispatch") && json_config.at("auto_dispatch").is_boolean()) {
      config.auto_dispatch = json_config.at("auto_dispatch").get<bool>();
    }

    config.validate();
    return config;
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      return fallback;
    }
    return value.get<int>();
  }

  void validate() const {
    if (history_limit < 1) {
      throw std::runtime_error("history_limit must be at least 1");
    }
    if (status_heartbeat_ms < 0) {
      throw std::runtime_error("status_heartbeat_ms cannot be negative");
    }
    if (default_cancel_reason.empty()) {
      throw std::runtime_error("default_cancel_reason cannot be empty");
    }
  }
};

}  // namespace agent_core
