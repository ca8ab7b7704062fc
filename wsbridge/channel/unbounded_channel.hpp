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
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "wsbridge/poll/poll.hpp"
#include "wsbridge/poll/waker.hpp"

namespace wsbridge {
namespace channel {

namespace detail {

template <typename T>
struct ChannelState {
  std::mutex mutex;
  std::deque<T> queue;
  size_t senders = 0;
  bool receiver_alive = true;
  std::optional<poll::Waker> receiver_waker;
};

}  // namespace detail

template <typename T>
class Receiver;

template <typename T>
class Sender;

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_unbounded_channel();

/**
 * @brief Producer end of an unbounded ordered channel
 *
 * Copyable; the channel is closed for the receiver once every sender copy
 * has been destroyed or closed.
 */
template <typename T>
class Sender {
 public:
  Sender(const Sender& other) : state_(other.state_) {
    if (state_) {
      std::lock_guard<std::mutex> lock(state_->mutex);
      ++state_->senders;
    }
  }

  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

  Sender& operator=(Sender other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~Sender() { close(); }

  /**
   * @brief Append a value and wake the receiver
   * @return false if the receiver is gone or this sender was closed; the value is dropped
   */
  bool push(T value) {
    if (!state_) return false;

    std::optional<poll::Waker> waker;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->receiver_alive) {
        return false;
      }
      state_->queue.push_back(std::move(value));
      waker.swap(state_->receiver_waker);
    }
    if (waker) waker->wake();
    return true;
  }

  /**
   * @brief Release this sender; the last release ends the stream
   */
  void close() {
    if (!state_) return;

    std::optional<poll::Waker> waker;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (--state_->senders == 0) {
        waker.swap(state_->receiver_waker);
      }
    }
    state_.reset();
    if (waker) waker->wake();
  }

  bool is_receiver_alive() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_alive;
  }

 private:
  friend std::pair<Sender<T>, Receiver<T>> make_unbounded_channel<T>();

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * @brief Single consumer end of an unbounded ordered channel
 *
 * Values come out in push order. poll_next() yields Ready(nullopt) once the
 * queue is drained and no sender remains.
 */
template <typename T>
class Receiver {
 public:
  Receiver(Receiver&& other) noexcept = default;
  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      detach();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  ~Receiver() { detach(); }

  poll::Poll<std::optional<T>> poll_next(poll::Context& cx) {
    if (!state_) return std::optional<T>();

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->queue.empty()) {
      std::optional<T> value(std::move(state_->queue.front()));
      state_->queue.pop_front();
      return poll::Poll<std::optional<T>>(std::move(value));
    }
    if (state_->senders == 0) {
      return std::optional<T>();
    }
    state_->receiver_waker = cx.waker();
    return poll::pending;
  }

  /**
   * @brief Pop the next value without registering for a wake-up
   */
  std::optional<T> try_next() {
    if (!state_) return std::nullopt;
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->queue.empty()) return std::nullopt;
    std::optional<T> value(std::move(state_->queue.front()));
    state_->queue.pop_front();
    return value;
  }

  size_t size() const {
    if (!state_) return 0;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
  }

  bool is_closed() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->senders == 0;
  }

 private:
  friend std::pair<Sender<T>, Receiver<T>> make_unbounded_channel<T>();

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

  void detach() {
    if (!state_) return;
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiver_alive = false;
      state_->receiver_waker.reset();
      dropped.swap(state_->queue);
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_unbounded_channel() {
  auto state = std::make_shared<detail::ChannelState<T>>();
  Sender<T> sender(state);
  Receiver<T> receiver(std::move(state));
  return {std::move(sender), std::move(receiver)};
}

}  // namespace channel
}  // namespace wsbridge
