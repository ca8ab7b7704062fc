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
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "wsbridge/message/message.hpp"

namespace wsbridge {
namespace interface {

/**
 * @brief How the transport hands binary frames to on_message
 */
enum class BinaryType { Blob, ArrayBuffer };

/**
 * @brief Opaque binary handle delivered when BinaryType::Blob is selected
 *
 * The payload is only reachable asynchronously, so the adapter never
 * accepts it.
 */
class Blob {
 public:
  Blob() = default;
  Blob(size_t size, std::string type) : size_(size), type_(std::move(type)) {}

  size_t size() const { return size_; }
  const std::string& type() const { return type_; }

 private:
  size_t size_ = 0;
  std::string type_;
};

/**
 * @brief Payload of a message event: raw bytes, text, or a blob handle
 */
using MessageData = std::variant<message::Bytes, std::string, Blob>;

/**
 * @brief An abstract callback-driven WebSocket connection
 *
 * Mirrors the browser WebSocket object: events are delivered through the
 * registered callbacks from the transport's own event loop, one at a time
 * and in order. Registering a callback replaces the previous one. Commands
 * report failures through the error_code out-parameter.
 */
class WebSocketTransport {
 public:
  using OnOpen = std::function<void()>;
  using OnMessage = std::function<void(const MessageData&)>;
  using OnError = std::function<void()>;
  using OnClose = std::function<void(const message::CloseEvent&)>;

  virtual ~WebSocketTransport() = default;

  virtual void set_binary_type(BinaryType type) = 0;
  virtual BinaryType binary_type() const = 0;

  virtual void on_open(OnOpen cb) = 0;
  virtual void on_message(OnMessage cb) = 0;
  virtual void on_error(OnError cb) = 0;
  virtual void on_close(OnClose cb) = 0;

  virtual void send_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) = 0;
  virtual void send_text(std::string_view text, boost::system::error_code& ec) = 0;

  virtual void close(boost::system::error_code& ec) = 0;
  virtual void close(uint16_t code, boost::system::error_code& ec) = 0;
  virtual void close(uint16_t code, std::string_view reason, boost::system::error_code& ec) = 0;

  /**
   * @brief Numeric ready state: 0 connecting, 1 open, 2 closing, 3 closed
   */
  virtual uint16_t ready_state() const = 0;

  /**
   * @brief Negotiated extensions, empty until open
   */
  virtual std::string extensions() const = 0;

  /**
   * @brief Negotiated sub-protocol, empty until open or when none was selected
   */
  virtual std::string protocol() const = 0;

  /**
   * @brief Begin connecting once the callbacks are registered
   *
   * No event is dispatched before this call. Transports that connect on
   * construction keep the default no-op.
   */
  virtual void start() {}
};

/**
 * @brief Creates transports for a URL and an ordered sub-protocol list
 *
 * On failure returns nullptr and sets ec; no connection attempt is made.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() = default;

  virtual std::shared_ptr<WebSocketTransport> create(const std::string& url, const std::vector<std::string>& protocols,
                                                     boost::system::error_code& ec) = 0;
};

}  // namespace interface
}  // namespace wsbridge
