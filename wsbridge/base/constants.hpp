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

#include <cstddef>
#include <cstdint>

namespace wsbridge {
namespace base {
namespace constants {

// Close status codes (RFC 6455 section 7.4)
constexpr uint16_t CLOSE_NORMAL = 1000;
constexpr uint16_t CLOSE_GOING_AWAY = 1001;
constexpr uint16_t CLOSE_NO_STATUS = 1005;  // "no status code present", never sent on the wire
constexpr uint16_t CLOSE_ABNORMAL = 1006;   // connection dropped without a close frame
constexpr uint16_t MIN_APPLICATION_CLOSE_CODE = 3000;
constexpr uint16_t MAX_APPLICATION_CLOSE_CODE = 4999;

// Close frame payload is 125 bytes, two of which carry the code
constexpr size_t MAX_CLOSE_REASON_BYTES = 123;

// Default ports
constexpr uint16_t DEFAULT_WS_PORT = 80;
constexpr uint16_t DEFAULT_WSS_PORT = 443;

// Handshake timeout
constexpr unsigned DEFAULT_HANDSHAKE_TIMEOUT_MS = 10000;  // 10 seconds
constexpr unsigned MIN_HANDSHAKE_TIMEOUT_MS = 100;        // 100ms minimum
constexpr unsigned MAX_HANDSHAKE_TIMEOUT_MS = 300000;     // 5 minutes maximum

// Message size limits
constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16MB
constexpr size_t MIN_MAX_MESSAGE_SIZE = 1024;                  // 1KB minimum
constexpr size_t MAX_MAX_MESSAGE_SIZE = 256 * 1024 * 1024;     // 256MB maximum

// Error handling
constexpr size_t DEFAULT_MAX_RECENT_ERRORS = 1000;
constexpr size_t DEFAULT_MAX_COMPONENT_ERRORS = 100;

// Validation
constexpr size_t MAX_HOSTNAME_LENGTH = 253;  // RFC 1123
constexpr size_t MAX_USER_AGENT_LENGTH = 256;

}  // namespace constants
}  // namespace base
}  // namespace wsbridge
