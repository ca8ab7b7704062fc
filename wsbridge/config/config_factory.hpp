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

#pragma once

#include <memory>
#include <string>

#include "wsbridge/base/visibility.hpp"
#include "wsbridge/config/iconfig_manager.hpp"
#include "wsbridge/config/websocket_config.hpp"

namespace wsbridge {
namespace config {

/**
 * Factory for configuration managers
 */
class WSBRIDGE_API ConfigFactory {
 public:
  static std::shared_ptr<ConfigManagerInterface> create();

  /**
   * Create a manager holding the websocket and logging defaults
   */
  static std::shared_ptr<ConfigManagerInterface> create_with_defaults();

  /**
   * Create a manager with defaults, then overlay values from a key=value file
   *
   * A missing or unreadable file leaves the defaults in place.
   */
  static std::shared_ptr<ConfigManagerInterface> create_from_file(const std::string& filepath);
};

/**
 * Default configuration items
 */
class WSBRIDGE_API ConfigPresets {
 public:
  /**
   * Register websocket.* items with range validators
   */
  static void setup_websocket_defaults(const std::shared_ptr<ConfigManagerInterface>& config);

  /**
   * Register logging.* items
   */
  static void setup_logging_defaults(const std::shared_ptr<ConfigManagerInterface>& config);

  static void setup_all_defaults(const std::shared_ptr<ConfigManagerInterface>& config);
};

/**
 * @brief Build a WebSocketConfig from websocket.* keys, falling back to defaults
 */
WSBRIDGE_API WebSocketConfig to_websocket_config(const ConfigManagerInterface& config);

/**
 * @brief Apply logging.* keys to the global Logger
 */
WSBRIDGE_API void apply_logging_config(const ConfigManagerInterface& config);

}  // namespace config
}  // namespace wsbridge
