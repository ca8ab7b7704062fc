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
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace wsbridge {
namespace message {

using Bytes = std::vector<uint8_t>;

/**
 * @brief A single WebSocket message, either text or binary
 */
class Message {
 public:
  static Message text(std::string value) { return Message(std::move(value)); }
  static Message bytes(Bytes value) { return Message(std::move(value)); }

  bool is_text() const { return std::holds_alternative<std::string>(payload_); }
  bool is_bytes() const { return std::holds_alternative<Bytes>(payload_); }

  /**
   * @throws std::bad_variant_access if the message is binary
   */
  const std::string& as_text() const { return std::get<std::string>(payload_); }

  /**
   * @throws std::bad_variant_access if the message is text
   */
  const Bytes& as_bytes() const { return std::get<Bytes>(payload_); }

  size_t size() const { return is_text() ? as_text().size() : as_bytes().size(); }

  bool operator==(const Message& other) const { return payload_ == other.payload_; }
  bool operator!=(const Message& other) const { return !(*this == other); }

 private:
  explicit Message(std::string value) : payload_(std::move(value)) {}
  explicit Message(Bytes value) : payload_(std::move(value)) {}

  std::variant<std::string, Bytes> payload_;
};

/**
 * @brief Close details reported by the transport when the connection ends
 */
struct CloseEvent {
  uint16_t code = 0;
  std::string reason;
  bool was_clean = false;

  bool operator==(const CloseEvent& other) const {
    return code == other.code && reason == other.reason && was_clean == other.was_clean;
  }
  bool operator!=(const CloseEvent& other) const { return !(*this == other); }
};

inline std::string describe(const Message& msg) {
  return std::string(msg.is_text() ? "text" : "binary") + " message (" + std::to_string(msg.size()) + " bytes)";
}

inline std::string describe(const CloseEvent& ev) {
  return "code=" + std::to_string(ev.code) + " reason=\"" + ev.reason + "\" clean=" + (ev.was_clean ? "true" : "false");
}

}  // namespace message
}  // namespace wsbridge
