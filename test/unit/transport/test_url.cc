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

#include <string>
#include <vector>

#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/transport/url.hpp"

using namespace wsbridge;
using namespace wsbridge::transport;

namespace {

boost::system::error_code parse_error(const std::string& url) {
  boost::system::error_code ec;
  parse_websocket_url(url, ec);
  return ec;
}

}  // namespace

TEST(UrlTest, ParsesPlainUrl) {
  boost::system::error_code ec;
  auto url = parse_websocket_url("ws://Example.COM:8080/chat?room=1", ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(url.scheme, "ws");
  EXPECT_EQ(url.host, "example.com");
  EXPECT_EQ(url.port, 8080);
  EXPECT_EQ(url.target, "/chat?room=1");
  EXPECT_FALSE(url.secure);
  EXPECT_EQ(url.host_header(), "example.com:8080");
}

TEST(UrlTest, DefaultsPortAndTarget) {
  boost::system::error_code ec;
  auto ws = parse_websocket_url("ws://localhost", ec);
  ASSERT_FALSE(ec);
  EXPECT_EQ(ws.port, 80);
  EXPECT_EQ(ws.target, "/");
  EXPECT_EQ(ws.host_header(), "localhost");

  auto wss = parse_websocket_url("WSS://secure.example", ec);
  ASSERT_FALSE(ec);
  EXPECT_TRUE(wss.secure);
  EXPECT_EQ(wss.port, 443);
}

TEST(UrlTest, QueryWithoutPathGetsRootTarget) {
  boost::system::error_code ec;
  auto url = parse_websocket_url("ws://host?x=1", ec);
  ASSERT_FALSE(ec);
  EXPECT_EQ(url.target, "/?x=1");
}

TEST(UrlTest, ParsesBracketedIpv6) {
  boost::system::error_code ec;
  auto url = parse_websocket_url("ws://[::1]:9001/", ec);
  ASSERT_FALSE(ec);
  EXPECT_EQ(url.host, "::1");
  EXPECT_EQ(url.port, 9001);
  EXPECT_EQ(url.host_header(), "[::1]:9001");
}

TEST(UrlTest, RejectsMalformedUrls) {
  const auto invalid = make_error_code(ErrorCode::InvalidUrl);
  EXPECT_EQ(parse_error(""), invalid);
  EXPECT_EQ(parse_error("example.com"), invalid);
  EXPECT_EQ(parse_error("ws://"), invalid);
  EXPECT_EQ(parse_error("ws:///path"), invalid);
  EXPECT_EQ(parse_error("ws://host/#fragment"), invalid);
  EXPECT_EQ(parse_error("ws://user:pass@host/"), invalid);
  EXPECT_EQ(parse_error("ws://bad host/"), invalid);
  EXPECT_EQ(parse_error("ws://host:70000/"), invalid);
  EXPECT_EQ(parse_error("ws://host:12ab/"), invalid);
  EXPECT_EQ(parse_error("ws://[::1/"), invalid);
  EXPECT_EQ(parse_error("ws://[zz]/"), invalid);
}

TEST(UrlTest, RejectsOtherSchemes) {
  const auto unsupported = make_error_code(ErrorCode::UnsupportedScheme);
  EXPECT_EQ(parse_error("http://example.com/"), unsupported);
  EXPECT_EQ(parse_error("ftp://example.com/"), unsupported);
}

TEST(UrlTest, RejectsBlockedPorts) {
  const auto blocked = make_error_code(ErrorCode::BlockedPort);
  EXPECT_EQ(parse_error("ws://host:25/"), blocked);
  EXPECT_EQ(parse_error("ws://host:6667/"), blocked);
  EXPECT_EQ(parse_error("ws://host:10080/"), blocked);
  EXPECT_FALSE(parse_error("ws://host:8080/"));
  EXPECT_TRUE(is_blocked_port(0));
  EXPECT_FALSE(is_blocked_port(443));
}

TEST(ProtocolListTest, AcceptsTokens) {
  boost::system::error_code ec;
  validate_protocols({}, ec);
  EXPECT_FALSE(ec);
  validate_protocols({"chat", "v2.json", "x-custom_1"}, ec);
  EXPECT_FALSE(ec);
}

TEST(ProtocolListTest, RejectsInvalidOrDuplicateEntries) {
  boost::system::error_code ec;
  validate_protocols({""}, ec);
  EXPECT_EQ(ec, make_error_code(ErrorCode::InvalidProtocol));
  validate_protocols({"has space"}, ec);
  EXPECT_EQ(ec, make_error_code(ErrorCode::InvalidProtocol));
  validate_protocols({"a,b"}, ec);
  EXPECT_EQ(ec, make_error_code(ErrorCode::InvalidProtocol));
  validate_protocols({"chat", "chat"}, ec);
  EXPECT_EQ(ec, make_error_code(ErrorCode::DuplicateProtocol));
}

TEST(ProtocolListTest, JoinsForHeader) {
  EXPECT_EQ(join_protocols({}), "");
  EXPECT_EQ(join_protocols({"a"}), "a");
  EXPECT_EQ(join_protocols({"a", "b", "c"}), "a, b, c");
}
