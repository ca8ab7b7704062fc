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

#include "wsbridge/adapter/websocket.hpp"

#include <stdexcept>

#include "wsbridge/adapter/websocket_core.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/diagnostics/logger.hpp"
#include "wsbridge/transport/beast_transport_factory.hpp"

namespace wsbridge {
namespace adapter {

namespace {

WebSocketCore& checked(const std::shared_ptr<WebSocketCore>& core) {
  if (!core) {
    throw std::logic_error("WebSocket handle has been released");
  }
  return *core;
}

void throw_on_send_error(const boost::system::error_code& ec) {
  if (ec) {
    throw diagnostics::SendException("Send failed: " + ec.message(), ec);
  }
}

poll::Poll<ReadyResult> always_ready() { return ReadyResult{}; }

}  // namespace

WebSocket WebSocket::open(const std::string& url) {
  return open_with_protocols(url, {}, transport::BeastTransportFactory::shared());
}

WebSocket WebSocket::open(const std::string& url, interface::TransportFactory& factory) {
  return open_with_protocols(url, {}, factory);
}

WebSocket WebSocket::open_with_protocol(const std::string& url, const std::string& protocol) {
  return open_with_protocols(url, {protocol}, transport::BeastTransportFactory::shared());
}

WebSocket WebSocket::open_with_protocol(const std::string& url, const std::string& protocol,
                                        interface::TransportFactory& factory) {
  return open_with_protocols(url, {protocol}, factory);
}

WebSocket WebSocket::open_with_protocols(const std::string& url, const std::vector<std::string>& protocols) {
  return open_with_protocols(url, protocols, transport::BeastTransportFactory::shared());
}

WebSocket WebSocket::open_with_protocols(const std::string& url, const std::vector<std::string>& protocols,
                                         interface::TransportFactory& factory) {
  boost::system::error_code ec;
  auto transport = factory.create(url, protocols, ec);
  if (!ec && !transport) {
    ec = make_error_code(ErrorCode::InternalError);
  }
  if (ec) {
    WSBRIDGE_LOG_ERROR("websocket", "open", "Cannot open " + url + ": " + ec.message());
    diagnostics::error_reporting::report_construction_error("websocket", "open", ec, url);
    throw diagnostics::ConstructionException("Cannot open " + url + ": " + ec.message(), url, ec);
  }

  WSBRIDGE_LOG_INFO("websocket", "open", "Connecting to " + url);
  return from_transport(std::move(transport));
}

WebSocket WebSocket::from_transport(std::shared_ptr<interface::WebSocketTransport> transport) {
  if (!transport) {
    throw std::invalid_argument("transport must not be null");
  }
  return WebSocket(WebSocketCore::create(std::move(transport)));
}

WebSocket WebSocket::reunite(WebSocketSink sink, WebSocketStream stream) {
  if (!sink.core_ || sink.core_ != stream.core_) {
    throw std::invalid_argument("Sink and stream do not belong to the same connection");
  }
  stream.core_.reset();
  return WebSocket(std::move(sink.core_));
}

WebSocket::WebSocket(std::shared_ptr<WebSocketCore> core) : core_(std::move(core)) {}

WebSocket::WebSocket(WebSocket&& other) noexcept = default;

WebSocket& WebSocket::operator=(WebSocket&& other) noexcept = default;

WebSocket::~WebSocket() = default;

base::ConnectionState WebSocket::state() const { return checked(core_).state(); }

std::string WebSocket::extensions() const { return checked(core_).extensions(); }

std::string WebSocket::protocol() const { return checked(core_).protocol(); }

void WebSocket::close(std::optional<uint16_t> code, std::optional<std::string> reason) {
  boost::system::error_code ec;
  close(code, std::move(reason), ec);
  if (ec) {
    throw diagnostics::CloseException("Close failed: " + ec.message(), ec);
  }
}

void WebSocket::close(std::optional<uint16_t> code, std::optional<std::string> reason, boost::system::error_code& ec) {
  auto core = std::move(core_);
  checked(core).close(code, reason, ec);
}

poll::Poll<ReadyResult> WebSocket::poll_ready(poll::Context& cx) { return checked(core_).poll_ready(cx); }

void WebSocket::start_send(const message::Message& msg) {
  boost::system::error_code ec;
  start_send(msg, ec);
  throw_on_send_error(ec);
}

void WebSocket::start_send(const message::Message& msg, boost::system::error_code& ec) {
  checked(core_).start_send(msg, ec);
}

poll::Poll<ReadyResult> WebSocket::poll_flush(poll::Context&) {
  checked(core_);
  return always_ready();
}

poll::Poll<ReadyResult> WebSocket::poll_close(poll::Context&) {
  checked(core_);
  return always_ready();
}

poll::Poll<std::optional<StreamItem>> WebSocket::poll_next(poll::Context& cx) { return checked(core_).poll_next(cx); }

std::pair<WebSocketSink, WebSocketStream> WebSocket::split() {
  auto core = std::move(core_);
  checked(core);
  return {WebSocketSink(core), WebSocketStream(core)};
}

base::ConnectionState WebSocketSink::state() const { return checked(core_).state(); }

std::string WebSocketSink::extensions() const { return checked(core_).extensions(); }

std::string WebSocketSink::protocol() const { return checked(core_).protocol(); }

poll::Poll<ReadyResult> WebSocketSink::poll_ready(poll::Context& cx) { return checked(core_).poll_ready(cx); }

void WebSocketSink::start_send(const message::Message& msg) {
  boost::system::error_code ec;
  start_send(msg, ec);
  throw_on_send_error(ec);
}

void WebSocketSink::start_send(const message::Message& msg, boost::system::error_code& ec) {
  checked(core_).start_send(msg, ec);
}

poll::Poll<ReadyResult> WebSocketSink::poll_flush(poll::Context&) {
  checked(core_);
  return always_ready();
}

poll::Poll<ReadyResult> WebSocketSink::poll_close(poll::Context&) {
  checked(core_);
  return always_ready();
}

bool WebSocketSink::is_pair_of(const WebSocketStream& stream) const {
  return core_ != nullptr && core_ == stream.core_;
}

base::ConnectionState WebSocketStream::state() const { return checked(core_).state(); }

std::string WebSocketStream::extensions() const { return checked(core_).extensions(); }

std::string WebSocketStream::protocol() const { return checked(core_).protocol(); }

poll::Poll<std::optional<StreamItem>> WebSocketStream::poll_next(poll::Context& cx) {
  return checked(core_).poll_next(cx);
}

}  // namespace adapter
}  // namespace wsbridge
