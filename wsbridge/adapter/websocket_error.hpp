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
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/message/message.hpp"

namespace wsbridge {
namespace adapter {

/**
 * @brief Error value yielded by the inbound stream
 *
 * kind() is one of ConnectionError, ConnectionClosed, SendFailed or
 * UnexpectedPayload. ConnectionClosed carries the close details and is
 * always the last item before end-of-stream.
 */
class WebSocketError {
 public:
  static WebSocketError connection_error() { return WebSocketError(ErrorCode::ConnectionError); }

  static WebSocketError connection_closed(message::CloseEvent event) {
    WebSocketError err(ErrorCode::ConnectionClosed);
    err.close_event_ = std::move(event);
    return err;
  }

  static WebSocketError send_failed(const boost::system::error_code& transport_error) {
    WebSocketError err(ErrorCode::SendFailed);
    err.transport_error_ = transport_error;
    err.detail_ = transport_error.message();
    return err;
  }

  static WebSocketError unexpected_payload(std::string detail) {
    WebSocketError err(ErrorCode::UnexpectedPayload);
    err.detail_ = std::move(detail);
    return err;
  }

  ErrorCode kind() const { return kind_; }
  boost::system::error_code code() const { return make_error_code(kind_); }

  bool is_connection_closed() const { return kind_ == ErrorCode::ConnectionClosed; }

  const std::optional<message::CloseEvent>& close_event() const { return close_event_; }
  const boost::system::error_code& transport_error() const { return transport_error_; }
  const std::string& detail() const { return detail_; }

  std::string message() const {
    std::string msg = to_string(kind_);
    if (close_event_) {
      msg += ": " + message::describe(*close_event_);
    } else if (!detail_.empty()) {
      msg += ": " + detail_;
    }
    return msg;
  }

  bool operator==(const WebSocketError& other) const {
    return kind_ == other.kind_ && close_event_ == other.close_event_ && transport_error_ == other.transport_error_ &&
           detail_ == other.detail_;
  }
  bool operator!=(const WebSocketError& other) const { return !(*this == other); }

 private:
  explicit WebSocketError(ErrorCode kind) : kind_(kind) {}

  ErrorCode kind_;
  std::optional<message::CloseEvent> close_event_;
  boost::system::error_code transport_error_;
  std::string detail_;
};

/**
 * @brief One item of the inbound stream: a message or an error
 */
using StreamItem = std::variant<message::Message, WebSocketError>;

}  // namespace adapter
}  // namespace wsbridge
