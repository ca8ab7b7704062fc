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

#include <cstdint>
#include <optional>
#include <string>

namespace wsbridge {
namespace base {

/**
 * @brief Connection lifecycle state as reported by the transport
 *
 * Values mirror the transport's numeric ready state (0..3).
 */
enum class ConnectionState { Connecting = 0, Open = 1, Closing = 2, Closed = 3 };

// LCOV_EXCL_START
inline const char* to_cstr(ConnectionState s) {
  switch (s) {
    case ConnectionState::Connecting:
      return "Connecting";
    case ConnectionState::Open:
      return "Open";
    case ConnectionState::Closing:
      return "Closing";
    case ConnectionState::Closed:
      return "Closed";
  }
  return "?";
}
// LCOV_EXCL_STOP

/**
 * @brief Map a numeric transport ready state onto ConnectionState
 * @return std::nullopt when the value is outside 0..3
 */
inline std::optional<ConnectionState> state_from_ready_state(uint16_t ready_state) {
  switch (ready_state) {
    case 0:
      return ConnectionState::Connecting;
    case 1:
      return ConnectionState::Open;
    case 2:
      return ConnectionState::Closing;
    case 3:
      return ConnectionState::Closed;
    default:
      return std::nullopt;
  }
}

inline uint16_t to_ready_state(ConnectionState s) { return static_cast<uint16_t>(s); }

}  // namespace base
}  // namespace wsbridge
