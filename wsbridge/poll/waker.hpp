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

#include <functional>
#include <memory>
#include <utility>

namespace wsbridge {
namespace poll {

/**
 * @brief Handle used to resume a task that returned Pending
 *
 * Copies share the same wake function; will_wake() compares that identity.
 * A default constructed Waker does nothing when woken.
 */
class Waker {
 public:
  using WakeFn = std::function<void()>;

  Waker() = default;
  explicit Waker(WakeFn fn) : fn_(std::make_shared<const WakeFn>(std::move(fn))) {}

  void wake() const {
    if (fn_ && *fn_) {
      (*fn_)();
    }
  }

  bool will_wake(const Waker& other) const { return fn_ == other.fn_; }

  static Waker noop() { return Waker(); }

 private:
  std::shared_ptr<const WakeFn> fn_;
};

/**
 * @brief Per-poll context handed to every poll_* operation
 */
class Context {
 public:
  explicit Context(Waker waker) : waker_(std::move(waker)) {}

  const Waker& waker() const { return waker_; }

 private:
  Waker waker_;
};

}  // namespace poll
}  // namespace wsbridge
