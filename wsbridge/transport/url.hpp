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
#include <string>
#include <vector>

#include "wsbridge/base/visibility.hpp"

namespace wsbridge {
namespace transport {

/**
 * @brief Parsed ws:// or wss:// URL
 */
struct Url {
  std::string scheme;  // "ws" or "wss", lowercase
  std::string host;    // without IPv6 brackets
  uint16_t port = 0;
  std::string target;  // path and query, at least "/"
  bool secure = false;

  /**
   * @brief Value for the Host header (port omitted when it is the scheme default)
   */
  std::string host_header() const;
};

/**
 * @brief Parse and validate a WebSocket URL
 *
 * Rejects unknown schemes (UnsupportedScheme), malformed URLs, fragments and
 * user info (InvalidUrl) and ports on the fetch "bad port" list (BlockedPort).
 */
WSBRIDGE_API Url parse_websocket_url(const std::string& url, boost::system::error_code& ec);

/**
 * @brief Check whether fetch-style clients must refuse to connect to this port
 */
WSBRIDGE_API bool is_blocked_port(uint16_t port);

/**
 * @brief Validate an ordered sub-protocol list
 *
 * Every entry must be a non-empty RFC 7230 token (InvalidProtocol) and
 * appear only once (DuplicateProtocol).
 */
WSBRIDGE_API void validate_protocols(const std::vector<std::string>& protocols, boost::system::error_code& ec);

/**
 * @brief Join sub-protocols for the Sec-WebSocket-Protocol header
 */
WSBRIDGE_API std::string join_protocols(const std::vector<std::string>& protocols);

}  // namespace transport
}  // namespace wsbridge
