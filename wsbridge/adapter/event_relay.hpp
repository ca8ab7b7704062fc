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
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "wsbridge/channel/unbounded_channel.hpp"
#include "wsbridge/interface/websocket_transport.hpp"
#include "wsbridge/message/message.hpp"
#include "wsbridge/poll/waker.hpp"

namespace wsbridge {
namespace adapter {

struct ErrorEvent {};
struct ConnectionClosed {};
struct UnexpectedPayload {
  std::string description;
};

/**
 * @brief Typed event pushed from the transport callbacks to the inbound stream
 *
 * A CloseEvent is always immediately followed by ConnectionClosed.
 */
using Notification = std::variant<message::Message, ErrorEvent, message::CloseEvent, ConnectionClosed, UnexpectedPayload>;

/**
 * @brief Single slot for the task waiting on the connection to open
 *
 * set() overwrites any earlier registration, so only the most recent
 * poller is woken.
 */
class PendingWaker {
 public:
  void set(const poll::Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    waker_ = waker;
  }

  std::optional<poll::Waker> take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<poll::Waker> taken;
    taken.swap(waker_);
    return taken;
  }

  bool is_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waker_.has_value();
  }

 private:
  mutable std::mutex mutex_;
  std::optional<poll::Waker> waker_;
};

/**
 * @brief Translates transport callbacks into notifications
 *
 * Owned jointly by the adapter and the callbacks registered on the
 * transport, so it outlives every reference the transport holds.
 */
class EventRelay {
 public:
  EventRelay(channel::Sender<Notification> sender, std::shared_ptr<PendingWaker> pending_waker);

  /**
   * @brief Register the four callbacks on the transport
   *
   * The transport must already deliver binary frames as byte buffers.
   */
  static void attach(const std::shared_ptr<EventRelay>& relay, interface::WebSocketTransport& transport);

  void handle_open();
  void handle_message(const interface::MessageData& data);
  void handle_error();
  void handle_close(const message::CloseEvent& event);

 private:
  void push(Notification notification);

  std::mutex mutex_;
  channel::Sender<Notification> sender_;
  std::shared_ptr<PendingWaker> pending_waker_;
};

}  // namespace adapter
}  // namespace wsbridge
