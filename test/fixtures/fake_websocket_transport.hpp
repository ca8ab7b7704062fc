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
#include <vector>

#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/interface/websocket_transport.hpp"

namespace wsbridge {
namespace test {

/**
 * @brief Scriptable in-memory transport
 *
 * Events are delivered synchronously on the calling thread by the emit_*
 * methods. Sends and close calls are recorded for inspection.
 */
class FakeWebSocketTransport : public interface::WebSocketTransport {
 public:
  struct SentFrame {
    bool text;
    std::string payload;
  };

  struct CloseCall {
    std::optional<uint16_t> code;
    std::optional<std::string> reason;
  };

  void set_binary_type(interface::BinaryType type) override {
    binary_type_ = type;
    ++binary_type_sets_;
    binary_type_set_before_callbacks_ = !on_open_ && !on_message_ && !on_error_ && !on_close_;
  }
  interface::BinaryType binary_type() const override { return binary_type_; }

  void on_open(OnOpen cb) override { on_open_ = std::move(cb); }
  void on_message(OnMessage cb) override { on_message_ = std::move(cb); }
  void on_error(OnError cb) override { on_error_ = std::move(cb); }
  void on_close(OnClose cb) override { on_close_ = std::move(cb); }

  void send_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) override {
    ec = send_error_;
    if (!ec) sent_.push_back({false, std::string(reinterpret_cast<const char*>(data), size)});
  }

  void send_text(std::string_view text, boost::system::error_code& ec) override {
    ec = send_error_;
    if (!ec) sent_.push_back({true, std::string(text)});
  }

  void close(boost::system::error_code& ec) override { record_close({std::nullopt, std::nullopt}, ec); }

  void close(uint16_t code, boost::system::error_code& ec) override { record_close({code, std::nullopt}, ec); }

  void close(uint16_t code, std::string_view reason, boost::system::error_code& ec) override {
    record_close({code, std::string(reason)}, ec);
  }

  uint16_t ready_state() const override { return ready_state_; }
  std::string extensions() const override { return extensions_; }
  std::string protocol() const override { return protocol_; }

  void start() override {
    ++starts_;
    started_after_callbacks_ = has_callbacks();
  }

  // Scripting
  void set_ready_state(uint16_t state) { ready_state_ = state; }
  void set_extensions(std::string value) { extensions_ = std::move(value); }
  void set_protocol(std::string value) { protocol_ = std::move(value); }
  void set_send_error(boost::system::error_code ec) { send_error_ = ec; }
  void set_close_error(boost::system::error_code ec) { close_error_ = ec; }

  void emit_open() {
    ready_state_ = 1;
    if (on_open_) on_open_();
  }

  void emit_text(const std::string& text) {
    if (on_message_) on_message_(interface::MessageData(text));
  }

  void emit_bytes(const std::vector<uint8_t>& bytes) {
    if (on_message_) on_message_(interface::MessageData(bytes));
  }

  void emit_blob(size_t size) {
    if (on_message_) on_message_(interface::MessageData(interface::Blob(size, "application/octet-stream")));
  }

  void emit_error() {
    if (on_error_) on_error_();
  }

  void emit_close(uint16_t code, const std::string& reason, bool was_clean) {
    ready_state_ = 3;
    if (on_close_) on_close_(message::CloseEvent{code, reason, was_clean});
  }

  // Inspection
  const std::vector<SentFrame>& sent() const { return sent_; }
  const std::vector<CloseCall>& close_calls() const { return close_calls_; }
  int binary_type_sets() const { return binary_type_sets_; }
  bool binary_type_set_before_callbacks() const { return binary_type_set_before_callbacks_; }
  bool has_callbacks() const { return on_open_ && on_message_ && on_error_ && on_close_; }
  int starts() const { return starts_; }
  bool started_after_callbacks() const { return started_after_callbacks_; }

 private:
  void record_close(CloseCall call, boost::system::error_code& ec) {
    close_calls_.push_back(std::move(call));
    ec = close_error_;
    if (!ec && ready_state_ < 2) ready_state_ = 2;
  }

  uint16_t ready_state_ = 0;
  std::string extensions_;
  std::string protocol_;
  interface::BinaryType binary_type_ = interface::BinaryType::Blob;
  int binary_type_sets_ = 0;
  bool binary_type_set_before_callbacks_ = false;
  int starts_ = 0;
  bool started_after_callbacks_ = false;

  OnOpen on_open_;
  OnMessage on_message_;
  OnError on_error_;
  OnClose on_close_;

  boost::system::error_code send_error_;
  boost::system::error_code close_error_;
  std::vector<SentFrame> sent_;
  std::vector<CloseCall> close_calls_;
};

/**
 * @brief Factory handing out FakeWebSocketTransport instances
 */
class FakeTransportFactory : public interface::TransportFactory {
 public:
  std::shared_ptr<interface::WebSocketTransport> create(const std::string& url,
                                                        const std::vector<std::string>& protocols,
                                                        boost::system::error_code& ec) override {
    last_url_ = url;
    last_protocols_ = protocols;
    ++create_count_;
    ec = create_error_;
    if (ec || return_null_) return nullptr;
    last_transport_ = std::make_shared<FakeWebSocketTransport>();
    return last_transport_;
  }

  void set_create_error(boost::system::error_code ec) { create_error_ = ec; }
  void set_return_null(bool value) { return_null_ = value; }

  const std::string& last_url() const { return last_url_; }
  const std::vector<std::string>& last_protocols() const { return last_protocols_; }
  std::shared_ptr<FakeWebSocketTransport> last_transport() const { return last_transport_; }
  int create_count() const { return create_count_; }

 private:
  boost::system::error_code create_error_;
  bool return_null_ = false;
  std::string last_url_;
  std::vector<std::string> last_protocols_;
  std::shared_ptr<FakeWebSocketTransport> last_transport_;
  int create_count_ = 0;
};

}  // namespace test
}  // namespace wsbridge
