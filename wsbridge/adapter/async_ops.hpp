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

#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "wsbridge/adapter/websocket_error.hpp"
#include "wsbridge/message/message.hpp"
#include "wsbridge/poll/poll.hpp"
#include "wsbridge/poll/waker.hpp"

namespace wsbridge {
namespace adapter {

using SendHandler = std::function<void(const boost::system::error_code&)>;
using ReceiveHandler = std::function<void(std::optional<StreamItem>)>;

namespace detail {

/**
 * @brief Drives a poll function on an executor until it completes
 *
 * Each Pending result leaves a waker behind that re-posts the poll, so the
 * operation keeps itself alive for as long as something can wake it.
 */
template <typename Executor, typename Result>
class PollOperation : public std::enable_shared_from_this<PollOperation<Executor, Result>> {
 public:
  using PollFn = std::function<poll::Poll<Result>(poll::Context&)>;
  using Handler = std::function<void(Result)>;

  PollOperation(Executor executor, PollFn poll_fn, Handler handler)
      : executor_(std::move(executor)), poll_fn_(std::move(poll_fn)), handler_(std::move(handler)) {}

  void start() {
    auto self = this->shared_from_this();
    boost::asio::post(executor_, [self]() { self->poll_once(); });
  }

 private:
  void poll_once() {
    if (done_) return;

    auto self = this->shared_from_this();
    poll::Context cx(poll::Waker([self]() { boost::asio::post(self->executor_, [self]() { self->poll_once(); }); }));

    auto result = poll_fn_(cx);
    if (result.is_pending()) return;

    done_ = true;
    handler_(std::move(result.value()));
  }

  Executor executor_;
  PollFn poll_fn_;
  Handler handler_;
  bool done_ = false;
};

template <typename Executor, typename Result>
void run_poll_operation(Executor executor, std::function<poll::Poll<Result>(poll::Context&)> poll_fn,
                        std::function<void(Result)> handler) {
  auto op = std::make_shared<PollOperation<Executor, Result>>(std::move(executor), std::move(poll_fn),
                                                              std::move(handler));
  op->start();
}

}  // namespace detail

/**
 * @brief Wait until the sink is ready, then send one message
 *
 * The handler runs on the executor with the transport's error, if any.
 * The sink must outlive the operation.
 *
 * @tparam Sink WebSocket or WebSocketSink
 */
template <typename Sink, typename Executor>
void async_send(Sink& sink, message::Message msg, Executor executor, SendHandler handler) {
  auto pending_msg = std::make_shared<message::Message>(std::move(msg));
  detail::run_poll_operation<Executor, boost::system::error_code>(
      std::move(executor),
      [&sink, pending_msg](poll::Context& cx) -> poll::Poll<boost::system::error_code> {
        auto ready = sink.poll_ready(cx);
        if (ready.is_pending()) return poll::pending;
        boost::system::error_code ec = ready.value();
        if (!ec) {
          sink.start_send(*pending_msg, ec);
        }
        return ec;
      },
      std::move(handler));
}

/**
 * @brief Wait for the next inbound item
 *
 * The handler receives nullopt at end of stream. The stream must outlive
 * the operation.
 *
 * @tparam Stream WebSocket or WebSocketStream
 */
template <typename Stream, typename Executor>
void async_receive(Stream& stream, Executor executor, ReceiveHandler handler) {
  detail::run_poll_operation<Executor, std::optional<StreamItem>>(
      std::move(executor), [&stream](poll::Context& cx) { return stream.poll_next(cx); }, std::move(handler));
}

}  // namespace adapter
}  // namespace wsbridge
