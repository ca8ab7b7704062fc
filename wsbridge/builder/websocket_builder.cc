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

#include "wsbridge/builder/websocket_builder.hpp"

#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/diagnostics/logger.hpp"
#include "wsbridge/transport/beast_transport_factory.hpp"

namespace wsbridge {
namespace builder {

WebSocketBuilder::WebSocketBuilder(std::string url) : url_(std::move(url)) {}

adapter::WebSocket WebSocketBuilder::build() {
  if (factory_) {
    return adapter::WebSocket::open_with_protocols(url_, protocols_, *factory_);
  }

  if (!cfg_.is_valid()) {
    WSBRIDGE_LOG_ERROR("websocket_builder", "build", "Transport settings out of range for " + url_);
    throw diagnostics::BuilderException("Transport settings out of range", "build");
  }

  // Transports do not reference the factory once created
  transport::BeastTransportFactory factory(cfg_);
  return adapter::WebSocket::open_with_protocols(url_, protocols_, factory);
}

WebSocketBuilder& WebSocketBuilder::protocol(const std::string& protocol) {
  protocols_.push_back(protocol);
  return *this;
}

WebSocketBuilder& WebSocketBuilder::protocols(std::vector<std::string> protocols) {
  protocols_ = std::move(protocols);
  return *this;
}

WebSocketBuilder& WebSocketBuilder::config(const config::WebSocketConfig& cfg) {
  cfg_ = cfg;
  return *this;
}

WebSocketBuilder& WebSocketBuilder::handshake_timeout(std::chrono::milliseconds timeout) {
  cfg_.handshake_timeout_ms = timeout.count() > 0 ? static_cast<unsigned>(timeout.count()) : 0;
  return *this;
}

WebSocketBuilder& WebSocketBuilder::max_message_size(size_t bytes) {
  cfg_.max_message_size = bytes;
  return *this;
}

WebSocketBuilder& WebSocketBuilder::user_agent(const std::string& user_agent) {
  cfg_.user_agent = user_agent;
  return *this;
}

WebSocketBuilder& WebSocketBuilder::transport_factory(std::shared_ptr<interface::TransportFactory> factory) {
  factory_ = std::move(factory);
  return *this;
}

}  // namespace builder
}  // namespace wsbridge
