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

#include "wsbridge/adapter/websocket_core.hpp"

#include <utility>

#include "wsbridge/base/constants.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {
namespace adapter {

using base::ConnectionState;

std::shared_ptr<WebSocketCore> WebSocketCore::create(std::shared_ptr<interface::WebSocketTransport> transport) {
  transport->set_binary_type(interface::BinaryType::ArrayBuffer);

  auto channel = channel::make_unbounded_channel<Notification>();
  auto pending_waker = std::make_shared<PendingWaker>();
  auto relay = std::make_shared<EventRelay>(std::move(channel.first), pending_waker);
  EventRelay::attach(relay, *transport);

  auto core = std::make_shared<WebSocketCore>(transport, std::move(channel.second), std::move(pending_waker),
                                              std::move(relay));
  transport->start();
  return core;
}

WebSocketCore::WebSocketCore(std::shared_ptr<interface::WebSocketTransport> transport,
                             channel::Receiver<Notification> receiver, std::shared_ptr<PendingWaker> pending_waker,
                             std::shared_ptr<EventRelay> relay)
    : transport_(std::move(transport)),
      pending_waker_(std::move(pending_waker)),
      relay_(std::move(relay)),
      receiver_(std::move(receiver)) {}

WebSocketCore::~WebSocketCore() {
  try {
    const uint16_t ready_state = transport_->ready_state();
    if (ready_state == base::to_ready_state(ConnectionState::Closing) ||
        ready_state == base::to_ready_state(ConnectionState::Closed)) {
      return;
    }

    boost::system::error_code ec;
    transport_->close(ec);
    if (ec) {
      WSBRIDGE_LOG_CRITICAL("websocket", "release", "Implicit close failed: " + ec.message());
      diagnostics::ErrorHandler::instance().report_error(
          diagnostics::ErrorInfo(diagnostics::ErrorLevel::CRITICAL, diagnostics::ErrorCategory::CONNECTION, "websocket",
                                 "release", "Implicit close failed: " + ec.message(), ec));
    } else {
      WSBRIDGE_LOG_DEBUG("websocket", "release", "Connection closed on release");
    }
  } catch (const std::exception& e) {
    WSBRIDGE_LOG_CRITICAL("websocket", "release", std::string("Exception during implicit close: ") + e.what());
  }
}

ConnectionState WebSocketCore::state() const {
  const uint16_t ready_state = transport_->ready_state();
  if (auto state = base::state_from_ready_state(ready_state)) {
    return *state;
  }

  const std::string message = "Transport reported unknown ready state " + std::to_string(ready_state);
  WSBRIDGE_LOG_CRITICAL("websocket", "state", message);
  diagnostics::error_reporting::report_contract_violation("websocket", "state", message);
  throw diagnostics::TransportContractException(message, "state");
}

std::string WebSocketCore::extensions() const { return transport_->extensions(); }

std::string WebSocketCore::protocol() const { return transport_->protocol(); }

void WebSocketCore::close(std::optional<uint16_t> code, const std::optional<std::string>& reason,
                          boost::system::error_code& ec) {
  ec.clear();
  if (!code && !reason) {
    transport_->close(ec);
  } else if (code && !reason) {
    transport_->close(*code, ec);
  } else if (code && reason) {
    transport_->close(*code, *reason, ec);
  } else {
    transport_->close(base::constants::CLOSE_NO_STATUS, *reason, ec);
  }

  if (ec) {
    WSBRIDGE_LOG_ERROR("websocket", "close", "Close rejected: " + ec.message());
    diagnostics::error_reporting::report_close_error("websocket", ec);
    return;
  }
  WSBRIDGE_LOG_INFO("websocket", "close",
                    "Close requested (code=" + (code ? std::to_string(*code) : std::string("none")) + ")");
}

poll::Poll<boost::system::error_code> WebSocketCore::poll_ready(poll::Context& cx) {
  if (state() != ConnectionState::Connecting) {
    return boost::system::error_code{};
  }

  pending_waker_->set(cx.waker());

  // The open event may have fired between the state read and the registration
  if (state() != ConnectionState::Connecting) {
    pending_waker_->take();
    return boost::system::error_code{};
  }
  return poll::pending;
}

void WebSocketCore::start_send(const message::Message& msg, boost::system::error_code& ec) {
  ec.clear();
  if (msg.is_text()) {
    transport_->send_text(msg.as_text(), ec);
  } else {
    const auto& bytes = msg.as_bytes();
    transport_->send_bytes(bytes.data(), bytes.size(), ec);
  }

  if (ec) {
    WSBRIDGE_LOG_ERROR("websocket", "send", "Failed to send " + message::describe(msg) + ": " + ec.message());
    diagnostics::error_reporting::report_send_error("websocket", ec);
  }
}

poll::Poll<std::optional<StreamItem>> WebSocketCore::poll_next(poll::Context& cx) {
  std::lock_guard<std::mutex> lock(receiver_mutex_);
  if (terminated_) {
    return std::optional<StreamItem>();
  }

  auto polled = receiver_.poll_next(cx);
  if (polled.is_pending()) {
    return poll::pending;
  }

  auto& notification = polled.value();
  if (!notification) {
    terminated_ = true;
    return std::optional<StreamItem>();
  }

  if (auto* msg = std::get_if<message::Message>(&*notification)) {
    return std::optional<StreamItem>(std::move(*msg));
  }
  if (std::holds_alternative<ErrorEvent>(*notification)) {
    return std::optional<StreamItem>(WebSocketError::connection_error());
  }
  if (auto* unexpected = std::get_if<UnexpectedPayload>(&*notification)) {
    return std::optional<StreamItem>(WebSocketError::unexpected_payload(std::move(unexpected->description)));
  }
  if (auto* close_event = std::get_if<message::CloseEvent>(&*notification)) {
    return std::optional<StreamItem>(WebSocketError::connection_closed(std::move(*close_event)));
  }

  // ConnectionClosed
  terminated_ = true;
  return std::optional<StreamItem>();
}

}  // namespace adapter
}  // namespace wsbridge
