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

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "wsbridge/adapter/websocket.hpp"
#include "wsbridge/base/visibility.hpp"
#include "wsbridge/config/websocket_config.hpp"
#include "wsbridge/interface/websocket_transport.hpp"

namespace wsbridge {
namespace builder {

/**
 * @brief Builder for WebSocket connections
 *
 * Provides a fluent API for choosing sub-protocols and transport settings
 * before opening the connection.
 */
class WSBRIDGE_API WebSocketBuilder {
 public:
  /**
   * @brief Construct a new WebSocketBuilder
   * @param url The ws:// URL to connect to
   */
  explicit WebSocketBuilder(std::string url);

  /**
   * @brief Open the connection
   * @return adapter::WebSocket The connecting handle
   * @throws BuilderException when the transport settings are out of range
   * @throws ConstructionException when the URL or the sub-protocols are rejected
   */
  adapter::WebSocket build();

  /**
   * @brief Append one sub-protocol to the offered list
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& protocol(const std::string& protocol);

  /**
   * @brief Replace the offered sub-protocol list, in preference order
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& protocols(std::vector<std::string> protocols);

  /**
   * @brief Replace all transport settings
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& config(const config::WebSocketConfig& cfg);

  /**
   * @brief Set the opening handshake timeout
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& handshake_timeout(std::chrono::milliseconds timeout);

  /**
   * @brief Set the largest message sent or received
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& max_message_size(size_t bytes);

  /**
   * @brief Set the User-Agent header of the handshake request
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& user_agent(const std::string& user_agent);

  /**
   * @brief Use a custom transport factory instead of the bundled Beast one
   *
   * Transport settings are ignored when a factory is given.
   * @return WebSocketBuilder& Reference to this builder for method chaining
   */
  WebSocketBuilder& transport_factory(std::shared_ptr<interface::TransportFactory> factory);

 private:
  std::string url_;
  std::vector<std::string> protocols_;
  config::WebSocketConfig cfg_;
  std::shared_ptr<interface::TransportFactory> factory_;
};

}  // namespace builder
}  // namespace wsbridge
