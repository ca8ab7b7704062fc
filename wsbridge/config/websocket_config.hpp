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
#include <string>

#include "wsbridge/base/constants.hpp"

namespace wsbridge {
namespace config {

/**
 * @brief Settings for the bundled Beast transport
 */
struct WebSocketConfig {
  unsigned handshake_timeout_ms = base::constants::DEFAULT_HANDSHAKE_TIMEOUT_MS;
  size_t max_message_size = base::constants::DEFAULT_MAX_MESSAGE_SIZE;
  std::string user_agent = "wsbridge";
  bool tcp_no_delay = true;

  bool is_valid() const {
    return handshake_timeout_ms >= base::constants::MIN_HANDSHAKE_TIMEOUT_MS &&
           handshake_timeout_ms <= base::constants::MAX_HANDSHAKE_TIMEOUT_MS &&
           max_message_size >= base::constants::MIN_MAX_MESSAGE_SIZE &&
           max_message_size <= base::constants::MAX_MAX_MESSAGE_SIZE &&
           user_agent.size() <= base::constants::MAX_USER_AGENT_LENGTH;
  }

  // Clamp values to valid ranges
  void validate_and_clamp() {
    if (handshake_timeout_ms < base::constants::MIN_HANDSHAKE_TIMEOUT_MS) {
      handshake_timeout_ms = base::constants::MIN_HANDSHAKE_TIMEOUT_MS;
    } else if (handshake_timeout_ms > base::constants::MAX_HANDSHAKE_TIMEOUT_MS) {
      handshake_timeout_ms = base::constants::MAX_HANDSHAKE_TIMEOUT_MS;
    }

    if (max_message_size < base::constants::MIN_MAX_MESSAGE_SIZE) {
      max_message_size = base::constants::MIN_MAX_MESSAGE_SIZE;
    } else if (max_message_size > base::constants::MAX_MAX_MESSAGE_SIZE) {
      max_message_size = base::constants::MAX_MAX_MESSAGE_SIZE;
    }

    if (user_agent.size() > base::constants::MAX_USER_AGENT_LENGTH) {
      user_agent.resize(base::constants::MAX_USER_AGENT_LENGTH);
    }
  }
};

}  // namespace config
}  // namespace wsbridge
