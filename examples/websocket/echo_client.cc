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

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>

#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/diagnostics/logger.hpp"
#include "wsbridge/wsbridge.hpp"

using namespace wsbridge;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running.store(false);
  }
}

/**
 * @brief Parks a thread until a waker fires or someone interrupts it
 */
class Parker {
 public:
  poll::Waker waker() const {
    auto state = state_;
    return poll::Waker([state]() { notify(*state); });
  }

  void unpark() { notify(*state_); }

  void park() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this]() { return state_->notified; });
    state_->notified = false;
  }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool notified = false;
  };

  static void notify(State& state) {
    {
      std::lock_guard<std::mutex> lock(state.mutex);
      state.notified = true;
    }
    state.cv.notify_all();
  }

  std::shared_ptr<State> state_ = std::make_shared<State>();
};

class EchoClient {
 public:
  explicit EchoClient(std::string url) : url_(std::move(url)), logger_(diagnostics::Logger::instance()) {}

  bool start(const std::string& protocol) {
    auto builder = wsbridge::websocket(url_);
    if (!protocol.empty()) {
      builder.protocol(protocol);
    }
#ifdef WSBRIDGE_ENABLE_CONFIG
    if (config_) {
      builder.config(config::to_websocket_config(*config_));
    }
#endif

    std::optional<WebSocket> socket;
    try {
      socket.emplace(builder.build());
    } catch (const diagnostics::WsBridgeException& e) {
      logger_.error("client", "startup", e.get_full_message());
      return false;
    }

    logger_.info("client", "startup", "Connecting to " + url_ + "...");
    Parker parker;
    poll::Context cx(parker.waker());
    while (socket->poll_ready(cx).is_pending()) {
      parker.park();
    }
    if (socket->state() != ConnectionState::Open) {
      logger_.error("client", "startup", "Connection failed");
      return false;
    }

    const std::string negotiated = socket->protocol();
    logger_.info("client", "startup", "Connected" + (negotiated.empty() ? std::string() : " (" + negotiated + ")"));

    auto halves = socket->split();
    sink_.emplace(std::move(halves.first));
    reader_ = std::thread([this, stream = std::move(halves.second)]() mutable {
      read_loop(stream);
      stream_.emplace(std::move(stream));
    });
    return true;
  }

#ifdef WSBRIDGE_ENABLE_CONFIG
  void load_config(const std::string& path) {
    config_ = config::ConfigFactory::create_from_file(path);
    config::apply_logging_config(*config_);
  }
#endif

  void run() {
    std::string line;
    while (g_running.load() && connected_.load() && std::getline(std::cin, line)) {
      if (line == "/quit" || line == "/exit") {
        break;
      }
      if (line.empty()) {
        continue;
      }

      boost::system::error_code ec;
      sink_->start_send(Message::text(line), ec);
      if (ec) {
        logger_.warning("client", "send", "Not sent: " + ec.message());
      }
    }
  }

  void shutdown() {
    reading_.store(false);
    reader_parker_.unpark();
    if (reader_.joinable()) {
      reader_.join();
    }
    if (!sink_ || !stream_) {
      return;
    }

    auto socket = WebSocket::reunite(std::move(*sink_), std::move(*stream_));
    sink_.reset();
    stream_.reset();
    try {
      socket.close(1000, "bye");
    } catch (const diagnostics::CloseException& e) {
      logger_.error("client", "shutdown", e.get_full_message());
    }
  }

 private:
  void read_loop(WebSocketStream& stream) {
    poll::Context cx(reader_parker_.waker());
    while (reading_.load()) {
      auto polled = stream.poll_next(cx);
      if (polled.is_pending()) {
        reader_parker_.park();
        continue;
      }

      auto& item = polled.value();
      if (!item) {
        logger_.info("client", "read", "Stream ended");
        connected_.store(false);
        return;
      }
      if (auto* msg = std::get_if<Message>(&*item)) {
        std::cout << "< " << (msg->is_text() ? msg->as_text() : message::describe(*msg)) << std::endl;
      } else {
        logger_.warning("client", "read", std::get<WebSocketError>(*item).message());
      }
    }
  }

  std::string url_;
  diagnostics::Logger& logger_;
  std::optional<WebSocketSink> sink_;
  std::optional<WebSocketStream> stream_;
  std::thread reader_;
  Parker reader_parker_;
  std::atomic<bool> reading_{true};
  std::atomic<bool> connected_{true};
#ifdef WSBRIDGE_ENABLE_CONFIG
  std::shared_ptr<config::ConfigManagerInterface> config_;
#endif
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <ws://host:port/path> [sub-protocol] [config-file]" << std::endl;
    return 1;
  }

  auto& logger = diagnostics::Logger::instance();
  logger.set_level(diagnostics::LogLevel::INFO);
  logger.set_console_output(true);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  EchoClient client(argv[1]);
#ifdef WSBRIDGE_ENABLE_CONFIG
  if (argc > 3) {
    client.load_config(argv[3]);
  }
#endif
  if (!client.start(argc > 2 ? argv[2] : "")) {
    return 1;
  }

  std::cout << "=== WebSocket Echo Client ===" << std::endl;
  std::cout << "Commands: <message>, /quit" << std::endl;

  client.run();
  client.shutdown();
  return 0;
}
