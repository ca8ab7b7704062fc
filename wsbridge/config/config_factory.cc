/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "wsbridge/config/config_factory.hpp"

#include "wsbridge/base/constants.hpp"
#include "wsbridge/config/config_manager.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {
namespace config {

namespace {

namespace constants = base::constants;

ConfigValidator int_range(const std::string& key, int min, int max) {
  return [key, min, max](const std::any& value) {
    const int v = std::any_cast<int>(value);
    if (v < min || v > max) {
      return ValidationResult::error(key + " must be within [" + std::to_string(min) + ", " + std::to_string(max) +
                                     "]");
    }
    return ValidationResult::success();
  };
}

template <typename T>
T value_or(const ConfigManagerInterface& config, const std::string& key, T fallback) {
  const std::any value = config.get(key, std::any());
  if (value.type() == typeid(T)) {
    return std::any_cast<T>(value);
  }
  if (value.has_value()) {
    WSBRIDGE_LOG_WARNING("config_factory", "read", "Ignoring " + key + " with an unexpected type");
  }
  return fallback;
}

}  // namespace

std::shared_ptr<ConfigManagerInterface> ConfigFactory::create() { return std::make_shared<ConfigManager>(); }

std::shared_ptr<ConfigManagerInterface> ConfigFactory::create_with_defaults() {
  auto config = create();
  ConfigPresets::setup_all_defaults(config);
  return config;
}

std::shared_ptr<ConfigManagerInterface> ConfigFactory::create_from_file(const std::string& filepath) {
  auto config = create_with_defaults();
  if (!config->load_from_file(filepath)) {
    WSBRIDGE_LOG_WARNING("config_factory", "create_from_file", "Using defaults, cannot load " + filepath);
    diagnostics::error_reporting::report_warning("config_factory", "create_from_file", "Cannot load " + filepath);
  }
  return config;
}

void ConfigPresets::setup_websocket_defaults(const std::shared_ptr<ConfigManagerInterface>& config) {
  config->register_item(ConfigItem("websocket.handshake_timeout_ms",
                                   static_cast<int>(constants::DEFAULT_HANDSHAKE_TIMEOUT_MS), ConfigType::Integer,
                                   false, "Opening handshake timeout in milliseconds"));
  config->register_validator("websocket.handshake_timeout_ms",
                             int_range("websocket.handshake_timeout_ms",
                                       static_cast<int>(constants::MIN_HANDSHAKE_TIMEOUT_MS),
                                       static_cast<int>(constants::MAX_HANDSHAKE_TIMEOUT_MS)));

  config->register_item(ConfigItem("websocket.max_message_size", static_cast<int>(constants::DEFAULT_MAX_MESSAGE_SIZE),
                                   ConfigType::Integer, false, "Largest message sent or received, in bytes"));
  config->register_validator("websocket.max_message_size",
                             int_range("websocket.max_message_size", static_cast<int>(constants::MIN_MAX_MESSAGE_SIZE),
                                       static_cast<int>(constants::MAX_MAX_MESSAGE_SIZE)));

  config->register_item(ConfigItem("websocket.user_agent", std::string("wsbridge"), ConfigType::String, false,
                                   "User-Agent header of the opening handshake"));
  config->register_validator("websocket.user_agent", [](const std::any& value) {
    if (std::any_cast<std::string>(value).size() > constants::MAX_USER_AGENT_LENGTH) {
      return ValidationResult::error("websocket.user_agent is too long");
    }
    return ValidationResult::success();
  });

  config->register_item(
      ConfigItem("websocket.tcp_no_delay", true, ConfigType::Boolean, false, "Disable Nagle's algorithm"));
}

void ConfigPresets::setup_logging_defaults(const std::shared_ptr<ConfigManagerInterface>& config) {
  config->register_item(
      ConfigItem("logging.level", std::string("info"), ConfigType::String, false, "debug|info|warning|error|critical"));
  config->register_item(ConfigItem("logging.enable_console", true, ConfigType::Boolean, false, "Log to the console"));
  config->register_item(ConfigItem("logging.enable_file", false, ConfigType::Boolean, false, "Log to a file"));
  config->register_item(
      ConfigItem("logging.file_path", std::string("wsbridge.log"), ConfigType::String, false, "Log file path"));
  config->register_item(ConfigItem("logging.format",
                                   std::string("{timestamp} [{level}] [{component}] [{operation}] {message}"),
                                   ConfigType::String, false, "Log line format"));
}

void ConfigPresets::setup_all_defaults(const std::shared_ptr<ConfigManagerInterface>& config) {
  setup_websocket_defaults(config);
  setup_logging_defaults(config);
}

WebSocketConfig to_websocket_config(const ConfigManagerInterface& config) {
  WebSocketConfig cfg;
  const int timeout =
      value_or<int>(config, "websocket.handshake_timeout_ms", static_cast<int>(cfg.handshake_timeout_ms));
  const int max_size = value_or<int>(config, "websocket.max_message_size", static_cast<int>(cfg.max_message_size));
  cfg.handshake_timeout_ms = timeout > 0 ? static_cast<unsigned>(timeout) : 0;
  cfg.max_message_size = max_size > 0 ? static_cast<size_t>(max_size) : 0;
  cfg.user_agent = value_or<std::string>(config, "websocket.user_agent", cfg.user_agent);
  cfg.tcp_no_delay = value_or<bool>(config, "websocket.tcp_no_delay", cfg.tcp_no_delay);

  if (!cfg.is_valid()) {
    WSBRIDGE_LOG_WARNING("config_factory", "to_websocket_config", "Clamping out-of-range websocket settings");
    diagnostics::error_reporting::report_configuration_error("config_factory", "to_websocket_config",
                                                             "Out-of-range websocket settings clamped");
    cfg.validate_and_clamp();
  }
  return cfg;
}

void apply_logging_config(const ConfigManagerInterface& config) {
  auto& logger = diagnostics::Logger::instance();

  const std::string level = value_or<std::string>(config, "logging.level", "info");
  logger.set_level(diagnostics::parse_log_level(level, diagnostics::LogLevel::INFO));
  logger.set_console_output(value_or<bool>(config, "logging.enable_console", true));

  if (value_or<bool>(config, "logging.enable_file", false)) {
    logger.set_file_output(value_or<std::string>(config, "logging.file_path", "wsbridge.log"));
  } else {
    logger.set_file_output("");
  }

  const std::string format = value_or<std::string>(config, "logging.format", "");
  if (!format.empty()) {
    logger.set_format(format);
  }
}

}  // namespace config
}  // namespace wsbridge
