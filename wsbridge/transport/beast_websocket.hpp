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

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "wsbridge/base/visibility.hpp"
#include "wsbridge/config/websocket_config.hpp"
#include "wsbridge/interface/websocket_transport.hpp"
#include "wsbridge/transport/url.hpp"

namespace wsbridge {
namespace transport {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

/**
 * @brief Browser-semantics WebSocket client on Boost.Beast
 *
 * All I/O and every callback runs on a strand of the given io_context.
 * Commands may be issued from any thread: ready-state transitions caused
 * by close() are visible immediately, the I/O itself is posted.
 */
class WSBRIDGE_API BeastWebSocket : public interface::WebSocketTransport,
                                    public std::enable_shared_from_this<BeastWebSocket> {
 public:
  /**
   * @brief Create an unstarted transport
   *
   * The URL and protocols must already be validated. No I/O happens until
   * start() is called.
   */
  static std::shared_ptr<BeastWebSocket> create(net::io_context& ioc, Url url, std::vector<std::string> protocols,
                                                const config::WebSocketConfig& cfg);

  BeastWebSocket(net::io_context& ioc, Url url, std::vector<std::string> protocols,
                 const config::WebSocketConfig& cfg);
  ~BeastWebSocket() override;

  void set_binary_type(interface::BinaryType type) override;
  interface::BinaryType binary_type() const override;

  void on_open(OnOpen cb) override;
  void on_message(OnMessage cb) override;
  void on_error(OnError cb) override;
  void on_close(OnClose cb) override;

  void send_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) override;
  void send_text(std::string_view text, boost::system::error_code& ec) override;

  void close(boost::system::error_code& ec) override;
  void close(uint16_t code, boost::system::error_code& ec) override;
  void close(uint16_t code, std::string_view reason, boost::system::error_code& ec) override;

  uint16_t ready_state() const override;
  std::string extensions() const override;
  std::string protocol() const override;

  /**
   * @brief Begin resolve, connect and handshake; later calls are ignored
   */
  void start() override;

 private:
  struct OutFrame {
    bool text;
    std::string payload;
  };

  void enqueue(OutFrame frame, boost::system::error_code& ec);
  void request_close(const websocket::close_reason& reason);
  message::CloseEvent received_close_event() const;

  void on_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& results);
  void on_connect(const boost::system::error_code& ec, const tcp::resolver::results_type::endpoint_type& endpoint);
  void on_handshake(const boost::system::error_code& ec);
  void do_read();
  void on_read(const boost::system::error_code& ec, std::size_t bytes);
  void do_write();
  void on_write(const boost::system::error_code& ec, std::size_t bytes);
  void on_close_complete(const boost::system::error_code& ec);

  void fail_connection(const boost::system::error_code& ec, const char* operation);
  void finish_close(const message::CloseEvent& event);
  bool accepts_protocol(const std::string& selected) const;

  void fire_open();
  void fire_message(const interface::MessageData& data);
  void fire_error();
  void fire_close(const message::CloseEvent& event);

  Url url_;
  std::vector<std::string> protocols_;
  config::WebSocketConfig cfg_;

  net::strand<net::io_context::executor_type> strand_;
  tcp::resolver resolver_;
  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer read_buffer_;
  websocket::response_type handshake_response_;

  // strand only
  std::deque<OutFrame> tx_;
  bool writing_ = false;
  bool closing_handshake_started_ = false;
  bool close_fired_ = false;
  std::optional<websocket::close_reason> pending_close_;

  std::atomic<uint16_t> ready_state_{0};
  std::atomic<interface::BinaryType> binary_type_{interface::BinaryType::Blob};
  std::atomic<bool> started_{false};

  mutable std::mutex mutex_;  // callbacks and negotiated values
  OnOpen on_open_;
  OnMessage on_message_;
  OnError on_error_;
  OnClose on_close_;
  std::string protocol_;
  std::string extensions_;
};

}  // namespace transport
}  // namespace wsbridge
