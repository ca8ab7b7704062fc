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

#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "test/fixtures/fake_websocket_transport.hpp"
#include "test/utils/test_utils.hpp"
#include "wsbridge/adapter/websocket.hpp"
#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/transport/beast_transport_factory.hpp"

using namespace wsbridge;
using namespace wsbridge::test;
using adapter::StreamItem;
using adapter::WebSocket;
using adapter::WebSocketError;
using message::CloseEvent;
using message::Message;

namespace {

/**
 * Fake that echoes every accepted text frame back as a message event
 */
class EchoingTransport : public FakeWebSocketTransport {
 public:
  void send_text(std::string_view text, boost::system::error_code& ec) override {
    FakeWebSocketTransport::send_text(text, ec);
    if (!ec) emit_text(std::string(text));
  }
};

std::vector<StreamItem> drain(WebSocket& ws, bool& ended) {
  CountingWaker waker;
  auto cx = waker.context();
  std::vector<StreamItem> items;
  ended = false;
  while (true) {
    auto polled = ws.poll_next(cx);
    if (polled.is_pending()) break;
    if (!polled.value()) {
      ended = true;
      break;
    }
    items.push_back(std::move(*polled.value()));
  }
  return items;
}

}  // namespace

TEST(WebSocketScenarioTest, EchoThenRemoteClose) {
  auto transport = std::make_shared<EchoingTransport>();
  auto ws = WebSocket::from_transport(transport);
  CountingWaker waker;
  auto cx = waker.context();

  transport->emit_open();
  ASSERT_TRUE(ws.poll_ready(cx).is_ready());
  ws.start_send(Message::text("a"));
  ASSERT_TRUE(ws.poll_ready(cx).is_ready());
  ws.start_send(Message::text("b"));
  transport->emit_close(1000, "bye", true);

  bool ended = false;
  auto items = drain(ws, ended);
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(std::get<Message>(items[0]), Message::text("a"));
  EXPECT_EQ(std::get<Message>(items[1]), Message::text("b"));
  EXPECT_EQ(std::get<WebSocketError>(items[2]), WebSocketError::connection_closed(CloseEvent{1000, "bye", true}));
  EXPECT_TRUE(ended);
}

TEST(WebSocketScenarioTest, InvalidUrlFailsSynchronously) {
  transport::BeastTransportFactory factory;

  EXPECT_THROW(WebSocket::open("http://example.com/", factory), diagnostics::ConstructionException);
  EXPECT_THROW(WebSocket::open("ws://", factory), diagnostics::ConstructionException);
  EXPECT_THROW(WebSocket::open("ws://example.com/#frag", factory), diagnostics::ConstructionException);

  try {
    WebSocket::open_with_protocols("ws://example.com/", {"chat", "chat"}, factory);
    FAIL() << "expected ConstructionException";
  } catch (const diagnostics::ConstructionException& e) {
    EXPECT_EQ(e.code(), make_error_code(ErrorCode::DuplicateProtocol));
  }
}

TEST(WebSocketScenarioTest, InvalidUrlRegistersNoCallbacks) {
  FakeTransportFactory factory;
  factory.set_create_error(make_error_code(ErrorCode::InvalidUrl));

  EXPECT_THROW(WebSocket::open("ws://bad host/", factory), diagnostics::ConstructionException);
  EXPECT_EQ(factory.last_transport(), nullptr);
}

TEST(WebSocketScenarioTest, SendWhileConnectingWaitsForOpen) {
  auto transport = std::make_shared<FakeWebSocketTransport>();
  auto ws = WebSocket::from_transport(transport);
  CountingWaker waker;
  auto cx = waker.context();

  EXPECT_TRUE(ws.poll_ready(cx).is_pending());
  EXPECT_TRUE(ws.poll_ready(cx).is_pending());
  EXPECT_TRUE(transport->sent().empty());

  transport->emit_open();
  EXPECT_EQ(waker.count(), 1);

  ASSERT_TRUE(ws.poll_ready(cx).is_ready());
  ws.start_send(Message::text("now"));
  ASSERT_EQ(transport->sent().size(), 1u);
  EXPECT_EQ(transport->sent()[0].payload, "now");
}

TEST(WebSocketScenarioTest, RandomEventSequencesKeepOrder) {
  std::mt19937 rng(20251019);

  for (int round = 0; round < 50; ++round) {
    auto transport = std::make_shared<FakeWebSocketTransport>();
    auto ws = WebSocket::from_transport(transport);
    transport->emit_open();

    std::vector<StreamItem> expected;
    const int events = static_cast<int>(rng() % 20);
    for (int i = 0; i < events; ++i) {
      switch (rng() % 3) {
        case 0: {
          std::string text = "t" + std::to_string(i);
          transport->emit_text(text);
          expected.emplace_back(Message::text(text));
          break;
        }
        case 1: {
          message::Bytes bytes(rng() % 4, static_cast<uint8_t>(i));
          transport->emit_bytes(bytes);
          expected.emplace_back(Message::bytes(bytes));
          break;
        }
        default:
          transport->emit_error();
          expected.emplace_back(WebSocketError::connection_error());
          break;
      }
    }

    const bool close = rng() % 2 == 0;
    if (close) {
      transport->emit_close(1001, "away", true);
      expected.emplace_back(WebSocketError::connection_closed(CloseEvent{1001, "away", true}));
    }

    bool ended = false;
    auto items = drain(ws, ended);
    EXPECT_EQ(ended, close) << "round " << round;
    ASSERT_EQ(items.size(), expected.size()) << "round " << round;
    for (size_t i = 0; i < items.size(); ++i) {
      EXPECT_EQ(items[i], expected[i]) << "round " << round << " item " << i;
    }
  }
}

TEST(WebSocketScenarioTest, StartSendWhileOpenForwards) {
  auto transport = std::make_shared<FakeWebSocketTransport>();
  auto ws = WebSocket::from_transport(transport);
  transport->emit_open();

  for (int i = 0; i < 10; ++i) {
    boost::system::error_code ec;
    ws.start_send(Message::text(std::to_string(i)), ec);
    EXPECT_FALSE(ec);
  }
  EXPECT_EQ(transport->sent().size(), 10u);
}
