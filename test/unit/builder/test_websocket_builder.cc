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

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "test/fixtures/fake_websocket_transport.hpp"
#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/wsbridge.hpp"

using namespace wsbridge;
using namespace std::chrono_literals;
using wsbridge::test::FakeTransportFactory;

class WebSocketBuilderTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeTransportFactory> factory_ = std::make_shared<FakeTransportFactory>();
};

TEST_F(WebSocketBuilderTest, OffersProtocolsInOrder) {
  auto ws = wsbridge::websocket("ws://example.com/chat")
                .protocol("v2.chat")
                .protocol("v1.chat")
                .transport_factory(factory_)
                .build();

  EXPECT_EQ(factory_->create_count(), 1);
  EXPECT_EQ(factory_->last_url(), "ws://example.com/chat");
  EXPECT_EQ(factory_->last_protocols(), (std::vector<std::string>{"v2.chat", "v1.chat"}));
  EXPECT_EQ(ws.state(), ConnectionState::Connecting);
}

TEST_F(WebSocketBuilderTest, ProtocolsReplacesEarlierChoices) {
  auto ws = builder::WebSocketBuilder("ws://example.com")
                .protocol("dropped")
                .protocols({"a", "b"})
                .transport_factory(factory_)
                .build();

  EXPECT_EQ(factory_->last_protocols(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(WebSocketBuilderTest, NoProtocolsByDefault) {
  auto ws = wsbridge::websocket("ws://example.com").transport_factory(factory_).build();
  EXPECT_TRUE(factory_->last_protocols().empty());
}

TEST_F(WebSocketBuilderTest, HandleFromBuilderIsUsable) {
  auto ws = wsbridge::websocket("ws://example.com").transport_factory(factory_).build();
  auto transport = factory_->last_transport();
  ASSERT_NE(transport, nullptr);

  transport->set_protocol("chat");
  transport->emit_open();
  EXPECT_EQ(ws.state(), ConnectionState::Open);
  EXPECT_EQ(ws.protocol(), "chat");
}

TEST_F(WebSocketBuilderTest, FactoryErrorsSurfaceAsConstructionException) {
  factory_->set_create_error(make_error_code(ErrorCode::DuplicateProtocol));
  try {
    wsbridge::websocket("ws://example.com").protocols({"x", "x"}).transport_factory(factory_).build();
    FAIL() << "expected ConstructionException";
  } catch (const diagnostics::ConstructionException& e) {
    EXPECT_EQ(e.code(), make_error_code(ErrorCode::DuplicateProtocol));
  }
}

TEST_F(WebSocketBuilderTest, OutOfRangeSettingsAreRejected) {
  EXPECT_THROW(wsbridge::websocket("ws://127.0.0.1:9").handshake_timeout(1ms).build(), diagnostics::BuilderException);
  EXPECT_THROW(wsbridge::websocket("ws://127.0.0.1:9").max_message_size(1).build(), diagnostics::BuilderException);
  EXPECT_THROW(wsbridge::websocket("ws://127.0.0.1:9").user_agent(std::string(1000, 'u')).build(),
               diagnostics::BuilderException);

  config::WebSocketConfig cfg;
  cfg.max_message_size = 0;
  EXPECT_THROW(wsbridge::websocket("ws://127.0.0.1:9").config(cfg).build(), diagnostics::BuilderException);
}

TEST_F(WebSocketBuilderTest, CustomFactoryIgnoresTransportSettings) {
  EXPECT_NO_THROW(wsbridge::websocket("ws://example.com").max_message_size(1).transport_factory(factory_).build());
  EXPECT_EQ(factory_->create_count(), 1);
}

TEST_F(WebSocketBuilderTest, BundledTransportRejectsSecureScheme) {
  try {
    wsbridge::websocket("wss://example.com").build();
    FAIL() << "expected ConstructionException";
  } catch (const diagnostics::ConstructionException& e) {
    EXPECT_EQ(e.code(), make_error_code(ErrorCode::UnsupportedScheme));
    EXPECT_EQ(e.get_url(), "wss://example.com");
  }
}

TEST_F(WebSocketBuilderTest, BundledTransportRejectsInvalidProtocol) {
  try {
    wsbridge::websocket("ws://127.0.0.1:8080").protocol("has space").build();
    FAIL() << "expected ConstructionException";
  } catch (const diagnostics::ConstructionException& e) {
    EXPECT_EQ(e.code(), make_error_code(ErrorCode::InvalidProtocol));
  }
}
