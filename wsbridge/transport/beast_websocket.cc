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

#include "wsbridge/transport/beast_websocket.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <chrono>

#include "wsbridge/base/common.hpp"
#include "wsbridge/base/constants.hpp"
#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {
namespace transport {

using base::ConnectionState;
using base::to_ready_state;
namespace constants = base::constants;

namespace {

constexpr const char* kComponent = "beast_transport";

const uint16_t kConnecting = to_ready_state(ConnectionState::Connecting);
const uint16_t kOpen = to_ready_state(ConnectionState::Open);
const uint16_t kClosing = to_ready_state(ConnectionState::Closing);
const uint16_t kClosed = to_ready_state(ConnectionState::Closed);

bool is_valid_close_code(uint16_t code) {
  return code == constants::CLOSE_NORMAL ||
         (code >= constants::MIN_APPLICATION_CLOSE_CODE && code <= constants::MAX_APPLICATION_CLOSE_CODE);
}

std::string to_std_string(beast::string_view value) { return std::string(value.data(), value.size()); }

}  // namespace

std::shared_ptr<BeastWebSocket> BeastWebSocket::create(net::io_context& ioc, Url url,
                                                       std::vector<std::string> protocols,
                                                       const config::WebSocketConfig& cfg) {
  return std::make_shared<BeastWebSocket>(ioc, std::move(url), std::move(protocols), cfg);
}

BeastWebSocket::BeastWebSocket(net::io_context& ioc, Url url, std::vector<std::string> protocols,
                               const config::WebSocketConfig& cfg)
    : url_(std::move(url)),
      protocols_(std::move(protocols)),
      cfg_(cfg),
      strand_(net::make_strand(ioc)),
      resolver_(strand_),
      ws_(strand_) {
  cfg_.validate_and_clamp();
}

BeastWebSocket::~BeastWebSocket() {
  WSBRIDGE_LOG_DEBUG(kComponent, "destroy", "Transport for " + url_.host_header() + " released");
}

void BeastWebSocket::set_binary_type(interface::BinaryType type) { binary_type_.store(type); }

interface::BinaryType BeastWebSocket::binary_type() const { return binary_type_.load(); }

void BeastWebSocket::on_open(OnOpen cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_open_ = std::move(cb);
}

void BeastWebSocket::on_message(OnMessage cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_message_ = std::move(cb);
}

void BeastWebSocket::on_error(OnError cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_error_ = std::move(cb);
}

void BeastWebSocket::on_close(OnClose cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_close_ = std::move(cb);
}

void BeastWebSocket::send_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) {
  OutFrame frame{false, std::string(reinterpret_cast<const char*>(data), size)};
  enqueue(std::move(frame), ec);
}

void BeastWebSocket::send_text(std::string_view text, boost::system::error_code& ec) {
  enqueue(OutFrame{true, std::string(text)}, ec);
}

void BeastWebSocket::enqueue(OutFrame frame, boost::system::error_code& ec) {
  ec.clear();
  const uint16_t state = ready_state_.load();
  if (state == kConnecting) {
    ec = make_error_code(ErrorCode::InvalidState);
    return;
  }
  if (frame.payload.size() > cfg_.max_message_size) {
    ec = make_error_code(ErrorCode::MessageTooLarge);
    return;
  }
  if (state != kOpen) {
    // Closing or closed: the data is discarded without an error
    WSBRIDGE_LOG_DEBUG(kComponent, "send", "Discarding message sent after close");
    return;
  }

  net::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
    if (self->close_fired_ || self->pending_close_) {
      return;
    }
    self->tx_.push_back(std::move(frame));
    if (!self->writing_) {
      self->do_write();
    }
  });
}

void BeastWebSocket::close(boost::system::error_code& ec) {
  ec.clear();
  request_close(websocket::close_reason{});
}

void BeastWebSocket::close(uint16_t code, boost::system::error_code& ec) { close(code, std::string_view{}, ec); }

void BeastWebSocket::close(uint16_t code, std::string_view reason, boost::system::error_code& ec) {
  ec.clear();
  if (!is_valid_close_code(code)) {
    ec = make_error_code(ErrorCode::InvalidCloseCode);
    return;
  }
  if (reason.size() > constants::MAX_CLOSE_REASON_BYTES) {
    ec = make_error_code(ErrorCode::CloseReasonTooLong);
    return;
  }
  request_close(websocket::close_reason(static_cast<websocket::close_code>(code),
                                        beast::string_view(reason.data(), reason.size())));
}

void BeastWebSocket::request_close(const websocket::close_reason& reason) {
  uint16_t current = ready_state_.load();
  while (true) {
    if (current == kClosing || current == kClosed) {
      return;
    }
    if (ready_state_.compare_exchange_weak(current, kClosing)) {
      break;
    }
  }

  auto self = shared_from_this();
  if (current == kConnecting) {
    net::post(strand_, [self] { self->fail_connection(net::error::operation_aborted, "close"); });
    return;
  }

  net::post(strand_, [self, reason] {
    if (self->close_fired_) {
      return;
    }
    self->pending_close_ = reason;
    if (!self->writing_) {
      self->do_write();
    }
  });
}

uint16_t BeastWebSocket::ready_state() const { return ready_state_.load(); }

std::string BeastWebSocket::extensions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return extensions_;
}

std::string BeastWebSocket::protocol() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return protocol_;
}

void BeastWebSocket::start() {
  if (started_.exchange(true)) {
    return;
  }
  net::post(strand_, [self = shared_from_this()] {
    if (self->close_fired_) {
      return;
    }
    WSBRIDGE_LOG_DEBUG(kComponent, "connect", "Resolving " + self->url_.host_header());
    self->resolver_.async_resolve(self->url_.host, std::to_string(self->url_.port),
                                  beast::bind_front_handler(&BeastWebSocket::on_resolve, self));
  });
}

void BeastWebSocket::on_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
  if (close_fired_) return;
  if (ec) {
    fail_connection(ec, "resolve");
    return;
  }

  beast::get_lowest_layer(ws_).expires_after(std::chrono::milliseconds(cfg_.handshake_timeout_ms));
  beast::get_lowest_layer(ws_).async_connect(results,
                                             beast::bind_front_handler(&BeastWebSocket::on_connect, shared_from_this()));
}

void BeastWebSocket::on_connect(const boost::system::error_code& ec,
                                const tcp::resolver::results_type::endpoint_type& /*endpoint*/) {
  if (close_fired_) return;
  if (ec) {
    fail_connection(ec, "connect");
    return;
  }

  if (cfg_.tcp_no_delay) {
    boost::system::error_code opt_ec;
    beast::get_lowest_layer(ws_).socket().set_option(tcp::no_delay(true), opt_ec);
    if (opt_ec) {
      WSBRIDGE_LOG_WARNING(kComponent, "connect", "Failed to set TCP_NODELAY: " + opt_ec.message());
    }
  }

  // The websocket stream has its own timeouts from here on
  beast::get_lowest_layer(ws_).expires_never();
  websocket::stream_base::timeout timeouts{std::chrono::milliseconds(cfg_.handshake_timeout_ms),
                                           websocket::stream_base::none(), false};
  ws_.set_option(timeouts);

  const std::string user_agent = cfg_.user_agent;
  const std::string offered = join_protocols(protocols_);
  ws_.set_option(websocket::stream_base::decorator([user_agent, offered](websocket::request_type& req) {
    req.set(beast::http::field::user_agent, user_agent);
    if (!offered.empty()) {
      req.set(beast::http::field::sec_websocket_protocol, offered);
    }
  }));
  ws_.read_message_max(cfg_.max_message_size);

  ws_.async_handshake(handshake_response_, url_.host_header(), url_.target,
                      beast::bind_front_handler(&BeastWebSocket::on_handshake, shared_from_this()));
}

void BeastWebSocket::on_handshake(const boost::system::error_code& ec) {
  if (close_fired_) return;
  if (ec) {
    fail_connection(ec, "handshake");
    return;
  }

  const std::string selected = to_std_string(handshake_response_[beast::http::field::sec_websocket_protocol]);
  if (!accepts_protocol(selected)) {
    WSBRIDGE_LOG_WARNING(kComponent, "handshake", "Server selected an unoffered sub-protocol: " + selected);
    fail_connection(make_error_code(ErrorCode::InvalidProtocol), "handshake");
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    protocol_ = selected;
    extensions_ = to_std_string(handshake_response_[beast::http::field::sec_websocket_extensions]);
  }

  uint16_t expected = kConnecting;
  if (!ready_state_.compare_exchange_strong(expected, kOpen)) {
    // close() raced the handshake; the posted abort finishes the connection
    return;
  }

  WSBRIDGE_LOG_INFO(kComponent, "handshake", "Connected to " + url_.host_header() + url_.target);
  fire_open();
  do_read();
}

bool BeastWebSocket::accepts_protocol(const std::string& selected) const {
  if (selected.empty()) return true;
  for (const auto& offered : protocols_) {
    if (offered == selected) return true;
  }
  return false;
}

void BeastWebSocket::do_read() {
  ws_.async_read(read_buffer_, beast::bind_front_handler(&BeastWebSocket::on_read, shared_from_this()));
}

void BeastWebSocket::on_read(const boost::system::error_code& ec, std::size_t /*bytes*/) {
  if (close_fired_) return;
  if (ec == websocket::error::closed) {
    finish_close(received_close_event());
    return;
  }
  if (ec) {
    fail_connection(ec, "read");
    return;
  }

  if (ws_.got_text()) {
    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    fire_message(interface::MessageData(std::move(text)));
  } else if (binary_type_.load() == interface::BinaryType::ArrayBuffer) {
    message::Bytes bytes(read_buffer_.size());
    net::buffer_copy(net::buffer(bytes), read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    fire_message(interface::MessageData(std::move(bytes)));
  } else {
    const size_t size = read_buffer_.size();
    read_buffer_.consume(size);
    fire_message(interface::MessageData(interface::Blob(size, "")));
  }

  if (!close_fired_) {
    do_read();
  }
}

void BeastWebSocket::do_write() {
  if (close_fired_) {
    tx_.clear();
    return;
  }

  if (!tx_.empty()) {
    writing_ = true;
    const OutFrame& frame = tx_.front();
    ws_.text(frame.text);
    ws_.async_write(net::buffer(frame.payload),
                    beast::bind_front_handler(&BeastWebSocket::on_write, shared_from_this()));
    return;
  }

  if (pending_close_ && !closing_handshake_started_) {
    closing_handshake_started_ = true;
    writing_ = true;
    ws_.async_close(*pending_close_, beast::bind_front_handler(&BeastWebSocket::on_close_complete, shared_from_this()));
    return;
  }

  writing_ = false;
}

void BeastWebSocket::on_write(const boost::system::error_code& ec, std::size_t /*bytes*/) {
  writing_ = false;
  if (close_fired_) return;
  if (ec) {
    fail_connection(ec, "write");
    return;
  }
  tx_.pop_front();
  do_write();
}

void BeastWebSocket::on_close_complete(const boost::system::error_code& ec) {
  writing_ = false;
  if (close_fired_) return;
  if (ec && ec != websocket::error::closed) {
    fail_connection(ec, "close");
    return;
  }
  finish_close(received_close_event());
}

message::CloseEvent BeastWebSocket::received_close_event() const {
  const websocket::close_reason& reason = ws_.reason();
  message::CloseEvent event;
  event.code = reason.code == static_cast<std::uint16_t>(websocket::close_code::none) ? constants::CLOSE_NO_STATUS
                                                                                      : reason.code;
  event.reason.assign(reason.reason.data(), reason.reason.size());
  event.was_clean = true;
  return event;
}

void BeastWebSocket::fail_connection(const boost::system::error_code& ec, const char* operation) {
  if (close_fired_) return;
  close_fired_ = true;
  ready_state_.store(kClosed);
  tx_.clear();
  pending_close_.reset();

  resolver_.cancel();
  beast::get_lowest_layer(ws_).close();

  if (ec == net::error::operation_aborted) {
    WSBRIDGE_LOG_INFO(kComponent, operation, "Connection attempt aborted by close()");
  } else {
    WSBRIDGE_LOG_WARNING(kComponent, operation, "Connection failed: " + ec.message());
    diagnostics::error_reporting::report_connection_error(kComponent, operation, ec);
  }

  fire_error();
  fire_close(message::CloseEvent{constants::CLOSE_ABNORMAL, "", false});
}

void BeastWebSocket::finish_close(const message::CloseEvent& event) {
  if (close_fired_) return;
  close_fired_ = true;
  ready_state_.store(kClosed);
  tx_.clear();
  pending_close_.reset();

  beast::get_lowest_layer(ws_).close();

  WSBRIDGE_LOG_INFO(kComponent, "close", "Connection closed: " + message::describe(event));
  fire_close(event);
}

void BeastWebSocket::fire_open() {
  OnOpen cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = on_open_;
  }
  if (cb) cb();
}

void BeastWebSocket::fire_message(const interface::MessageData& data) {
  OnMessage cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = on_message_;
  }
  if (cb) cb(data);
}

void BeastWebSocket::fire_error() {
  OnError cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = on_error_;
  }
  if (cb) cb();
}

void BeastWebSocket::fire_close(const message::CloseEvent& event) {
  OnClose cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = on_close_;
    // No events follow close; release what the callbacks hold
    on_open_ = nullptr;
    on_message_ = nullptr;
    on_error_ = nullptr;
    on_close_ = nullptr;
  }
  if (cb) cb(event);
}

}  // namespace transport
}  // namespace wsbridge
