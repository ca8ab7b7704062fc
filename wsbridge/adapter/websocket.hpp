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
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "wsbridge/adapter/websocket_error.hpp"
#include "wsbridge/base/common.hpp"
#include "wsbridge/base/visibility.hpp"
#include "wsbridge/interface/websocket_transport.hpp"
#include "wsbridge/message/message.hpp"
#include "wsbridge/poll/poll.hpp"
#include "wsbridge/poll/waker.hpp"

namespace wsbridge {
namespace adapter {

class WebSocketCore;
class WebSocketSink;
class WebSocketStream;

/**
 * @brief Result of poll_ready, poll_flush and poll_close (always success when ready)
 */
using ReadyResult = boost::system::error_code;

/**
 * @brief Pollable WebSocket: an outbound sink and an inbound stream over one transport
 *
 * Move-only handle. Releasing the last handle (this object, or both halves
 * after split()) closes the connection unless it is already closing or
 * closed. Calling any operation on a released handle throws std::logic_error.
 */
class WSBRIDGE_API WebSocket {
 public:
  /**
   * @brief Open a connection using the bundled Beast transport
   * @param url ws:// URL to connect to
   * @throws diagnostics::ConstructionException if the URL or sub-protocols are rejected
   */
  static WebSocket open(const std::string& url);
  static WebSocket open(const std::string& url, interface::TransportFactory& factory);

  /**
   * @brief Open a connection requesting a single sub-protocol
   */
  static WebSocket open_with_protocol(const std::string& url, const std::string& protocol);
  static WebSocket open_with_protocol(const std::string& url, const std::string& protocol,
                                      interface::TransportFactory& factory);

  /**
   * @brief Open a connection requesting an ordered list of sub-protocols
   */
  static WebSocket open_with_protocols(const std::string& url, const std::vector<std::string>& protocols);
  static WebSocket open_with_protocols(const std::string& url, const std::vector<std::string>& protocols,
                                       interface::TransportFactory& factory);

  /**
   * @brief Wrap a transport that has already been constructed
   *
   * Switches the transport to byte-buffer payloads and registers the event
   * callbacks, replacing any that were set before.
   */
  static WebSocket from_transport(std::shared_ptr<interface::WebSocketTransport> transport);

  /**
   * @brief Rebuild a WebSocket from the two halves returned by split()
   * @throws std::invalid_argument if the halves belong to different connections
   */
  static WebSocket reunite(WebSocketSink sink, WebSocketStream stream);

  WebSocket(WebSocket&& other) noexcept;
  WebSocket& operator=(WebSocket&& other) noexcept;
  ~WebSocket();

  WebSocket(const WebSocket&) = delete;
  WebSocket& operator=(const WebSocket&) = delete;

  /**
   * @brief False once the handle was closed, split or moved from
   */
  bool valid() const { return core_ != nullptr; }

  base::ConnectionState state() const;
  std::string extensions() const;
  std::string protocol() const;

  /**
   * @brief Close the connection and release this handle
   *
   * Neither argument: plain close. Code only: close with code. Both: close
   * with code and reason. Reason only: close with the "no status" code 1005.
   * The handle is released even when the transport rejects the request.
   *
   * @throws diagnostics::CloseException if the transport rejects the code or reason
   */
  void close(std::optional<uint16_t> code = std::nullopt, std::optional<std::string> reason = std::nullopt);
  void close(std::optional<uint16_t> code, std::optional<std::string> reason, boost::system::error_code& ec);

  /**
   * @brief Pending while the connection is still being established
   *
   * Only the most recent waiter is remembered and woken on open.
   */
  poll::Poll<ReadyResult> poll_ready(poll::Context& cx);

  /**
   * @brief Hand a message to the transport without checking state first
   * @throws diagnostics::SendException wrapping the transport's error
   */
  void start_send(const message::Message& msg);
  void start_send(const message::Message& msg, boost::system::error_code& ec);

  /**
   * @brief Always ready; the transport buffers internally
   */
  poll::Poll<ReadyResult> poll_flush(poll::Context& cx);

  /**
   * @brief Always ready; does not close the connection
   */
  poll::Poll<ReadyResult> poll_close(poll::Context& cx);

  /**
   * @brief Next inbound item, Ready(nullopt) at end of stream
   */
  poll::Poll<std::optional<StreamItem>> poll_next(poll::Context& cx);

  /**
   * @brief Split into independently usable sink and stream halves; releases this handle
   */
  std::pair<WebSocketSink, WebSocketStream> split();

 private:
  explicit WebSocket(std::shared_ptr<WebSocketCore> core);

  std::shared_ptr<WebSocketCore> core_;
};

/**
 * @brief Outbound half of a split WebSocket
 */
class WSBRIDGE_API WebSocketSink {
 public:
  WebSocketSink(WebSocketSink&&) noexcept = default;
  WebSocketSink& operator=(WebSocketSink&&) noexcept = default;

  base::ConnectionState state() const;
  std::string extensions() const;
  std::string protocol() const;

  poll::Poll<ReadyResult> poll_ready(poll::Context& cx);
  void start_send(const message::Message& msg);
  void start_send(const message::Message& msg, boost::system::error_code& ec);
  poll::Poll<ReadyResult> poll_flush(poll::Context& cx);
  poll::Poll<ReadyResult> poll_close(poll::Context& cx);

  bool is_pair_of(const WebSocketStream& stream) const;

 private:
  friend class WebSocket;
  explicit WebSocketSink(std::shared_ptr<WebSocketCore> core) : core_(std::move(core)) {}

  std::shared_ptr<WebSocketCore> core_;
};

/**
 * @brief Inbound half of a split WebSocket
 */
class WSBRIDGE_API WebSocketStream {
 public:
  WebSocketStream(WebSocketStream&&) noexcept = default;
  WebSocketStream& operator=(WebSocketStream&&) noexcept = default;

  base::ConnectionState state() const;
  std::string extensions() const;
  std::string protocol() const;

  poll::Poll<std::optional<StreamItem>> poll_next(poll::Context& cx);

 private:
  friend class WebSocket;
  friend class WebSocketSink;
  explicit WebSocketStream(std::shared_ptr<WebSocketCore> core) : core_(std::move(core)) {}

  std::shared_ptr<WebSocketCore> core_;
};

}  // namespace adapter
}  // namespace wsbridge
