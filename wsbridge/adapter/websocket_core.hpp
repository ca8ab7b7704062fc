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

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "wsbridge/adapter/event_relay.hpp"
#include "wsbridge/adapter/websocket_error.hpp"
#include "wsbridge/base/common.hpp"
#include "wsbridge/channel/unbounded_channel.hpp"
#include "wsbridge/interface/websocket_transport.hpp"
#include "wsbridge/message/message.hpp"
#include "wsbridge/poll/poll.hpp"
#include "wsbridge/poll/waker.hpp"

namespace wsbridge {
namespace adapter {

/**
 * @brief Connection state shared by a WebSocket and its split halves
 *
 * Destroyed with the last owning handle; the destructor closes the
 * transport unless it is already closing or closed. A failed implicit
 * close is deliberately not fatal: it is logged and reported to the
 * ErrorHandler at CRITICAL and the destructor returns normally.
 */
class WebSocketCore {
 public:
  /**
   * @brief Configure the transport for byte-buffer payloads, register the relay, then start it
   */
  static std::shared_ptr<WebSocketCore> create(std::shared_ptr<interface::WebSocketTransport> transport);

  WebSocketCore(std::shared_ptr<interface::WebSocketTransport> transport, channel::Receiver<Notification> receiver,
                std::shared_ptr<PendingWaker> pending_waker, std::shared_ptr<EventRelay> relay);
  ~WebSocketCore();

  WebSocketCore(const WebSocketCore&) = delete;
  WebSocketCore& operator=(const WebSocketCore&) = delete;

  /**
   * @throws diagnostics::TransportContractException if the ready state is outside 0..3
   */
  base::ConnectionState state() const;
  std::string extensions() const;
  std::string protocol() const;

  void close(std::optional<uint16_t> code, const std::optional<std::string>& reason, boost::system::error_code& ec);

  poll::Poll<boost::system::error_code> poll_ready(poll::Context& cx);
  void start_send(const message::Message& msg, boost::system::error_code& ec);
  poll::Poll<std::optional<StreamItem>> poll_next(poll::Context& cx);

 private:
  std::shared_ptr<interface::WebSocketTransport> transport_;
  std::shared_ptr<PendingWaker> pending_waker_;
  std::shared_ptr<EventRelay> relay_;

  std::mutex receiver_mutex_;
  channel::Receiver<Notification> receiver_;
  bool terminated_ = false;
};

}  // namespace adapter
}  // namespace wsbridge
