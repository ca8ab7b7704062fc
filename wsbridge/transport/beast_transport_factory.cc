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

#include "wsbridge/transport/beast_transport_factory.hpp"

#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/concurrency/io_context_manager.hpp"
#include "wsbridge/diagnostics/logger.hpp"
#include "wsbridge/transport/beast_websocket.hpp"
#include "wsbridge/transport/url.hpp"

namespace wsbridge {
namespace transport {

BeastTransportFactory& BeastTransportFactory::shared() {
  static BeastTransportFactory factory;
  return factory;
}

BeastTransportFactory::BeastTransportFactory(const config::WebSocketConfig& cfg)
    : cfg_(cfg), manager_(&concurrency::IoContextManager::instance()) {
  cfg_.validate_and_clamp();
}

BeastTransportFactory::BeastTransportFactory(boost::asio::io_context& ioc, const config::WebSocketConfig& cfg)
    : cfg_(cfg), ioc_(&ioc) {
  cfg_.validate_and_clamp();
}

boost::asio::io_context& BeastTransportFactory::context() {
  if (ioc_) {
    return *ioc_;
  }
  auto& ioc = manager_->get_context();
  manager_->start();
  return ioc;
}

std::shared_ptr<interface::WebSocketTransport> BeastTransportFactory::create(const std::string& url,
                                                                             const std::vector<std::string>& protocols,
                                                                             boost::system::error_code& ec) {
  Url parsed = parse_websocket_url(url, ec);
  if (ec) {
    return nullptr;
  }
  if (parsed.secure) {
    WSBRIDGE_LOG_WARNING("beast_transport", "create", "TLS is not available for " + url);
    ec = make_error_code(ErrorCode::UnsupportedScheme);
    return nullptr;
  }

  validate_protocols(protocols, ec);
  if (ec) {
    return nullptr;
  }

  return BeastWebSocket::create(context(), std::move(parsed), protocols, cfg_);
}

}  // namespace transport
}  // namespace wsbridge
