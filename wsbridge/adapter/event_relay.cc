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

#include "wsbridge/adapter/event_relay.hpp"

#include <utility>

#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {
namespace adapter {

EventRelay::EventRelay(channel::Sender<Notification> sender, std::shared_ptr<PendingWaker> pending_waker)
    : sender_(std::move(sender)), pending_waker_(std::move(pending_waker)) {}

void EventRelay::attach(const std::shared_ptr<EventRelay>& relay, interface::WebSocketTransport& transport) {
  transport.on_open([relay]() { relay->handle_open(); });
  transport.on_message([relay](const interface::MessageData& data) { relay->handle_message(data); });
  transport.on_error([relay]() { relay->handle_error(); });
  transport.on_close([relay](const message::CloseEvent& event) { relay->handle_close(event); });
}

void EventRelay::handle_open() {
  WSBRIDGE_LOG_DEBUG("event_relay", "open", "Connection opened");
  if (auto waker = pending_waker_->take()) {
    waker->wake();
  }
}

void EventRelay::handle_message(const interface::MessageData& data) {
  if (const auto* bytes = std::get_if<message::Bytes>(&data)) {
    push(message::Message::bytes(*bytes));
  } else if (const auto* text = std::get_if<std::string>(&data)) {
    push(message::Message::text(*text));
  } else {
    const auto& blob = std::get<interface::Blob>(data);
    std::string description = "blob payload of " + std::to_string(blob.size()) + " bytes";
    WSBRIDGE_LOG_CRITICAL("event_relay", "message", "Transport delivered " + description + " in byte-buffer mode");
    diagnostics::error_reporting::report_contract_violation("event_relay", "message",
                                                           "unexpected " + description);
    push(UnexpectedPayload{std::move(description)});
  }
}

void EventRelay::handle_error() {
  WSBRIDGE_LOG_DEBUG("event_relay", "error", "Transport reported an error event");
  push(ErrorEvent{});
}

void EventRelay::handle_close(const message::CloseEvent& event) {
  WSBRIDGE_LOG_DEBUG("event_relay", "close", "Connection closed: " + message::describe(event));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Failed pushes mean the adapter is gone
    if (sender_.push(event)) {
      sender_.push(ConnectionClosed{});
    }
  }

  // A connection that never opened still releases a sender waiting on readiness
  if (auto waker = pending_waker_->take()) {
    waker->wake();
  }
}

void EventRelay::push(Notification notification) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sender_.push(std::move(notification))) {
    WSBRIDGE_LOG_DEBUG("event_relay", "push", "Receiver released, notification dropped");
  }
}

}  // namespace adapter
}  // namespace wsbridge
