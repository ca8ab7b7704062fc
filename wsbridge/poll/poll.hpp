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

#include <optional>
#include <utility>

namespace wsbridge {
namespace poll {

/**
 * @brief Tag for a poll result that is not ready yet
 */
struct Pending {};

inline constexpr Pending pending{};

/**
 * @brief Result of a single poll: either Ready(value) or Pending
 *
 * A Pending result promises that the waker from the polling Context has
 * been registered and will be woken once progress is possible.
 */
template <typename T>
class Poll {
 public:
  Poll(Pending) {}  // NOLINT(google-explicit-constructor)
  Poll(T value) : value_(std::move(value)) {}  // NOLINT(google-explicit-constructor)

  bool is_ready() const { return value_.has_value(); }
  bool is_pending() const { return !value_.has_value(); }

  /**
   * @brief Access the ready value
   * @throws std::bad_optional_access if the poll is pending
   */
  T& value() { return value_.value(); }
  const T& value() const { return value_.value(); }

 private:
  std::optional<T> value_;
};

template <typename T>
Poll<T> ready(T value) {
  return Poll<T>(std::move(value));
}

}  // namespace poll
}  // namespace wsbridge
