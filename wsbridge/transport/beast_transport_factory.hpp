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

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <vector>

#include "wsbridge/base/visibility.hpp"
#include "wsbridge/config/websocket_config.hpp"
#include "wsbridge/interface/websocket_transport.hpp"

namespace wsbridge {
namespace concurrency {
class IoContextManager;
}

namespace transport {

/**
 * @brief Creates BeastWebSocket transports for ws:// URLs
 *
 * Validation of the URL and the sub-protocol list happens synchronously in
 * create(); every failure is reported through the error_code and no
 * transport is created.
 */
class WSBRIDGE_API BeastTransportFactory : public interface::TransportFactory {
 public:
  /**
   * @brief Factory running on the shared IoContextManager with default settings
   */
  static BeastTransportFactory& shared();

  /**
   * @brief Use the shared IoContextManager, starting its thread on first use
   */
  explicit BeastTransportFactory(const config::WebSocketConfig& cfg = config::WebSocketConfig{});

  /**
   * @brief Use a caller-driven io_context; the caller runs it
   */
  BeastTransportFactory(boost::asio::io_context& ioc, const config::WebSocketConfig& cfg = config::WebSocketConfig{});

  std::shared_ptr<interface::WebSocketTransport> create(const std::string& url,
                                                        const std::vector<std::string>& protocols,
                                                        boost::system::error_code& ec) override;

  const config::WebSocketConfig& settings() const { return cfg_; }

 private:
  boost::asio::io_context& context();

  config::WebSocketConfig cfg_;
  boost::asio::io_context* ioc_ = nullptr;
  concurrency::IoContextManager* manager_ = nullptr;
};

}  // namespace transport
}  // namespace wsbridge
