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
#include <thread>
#include <vector>

#include "test/utils/test_utils.hpp"
#include "wsbridge/channel/unbounded_channel.hpp"

using namespace wsbridge;
using namespace wsbridge::test;

TEST(UnboundedChannelTest, DeliversInPushOrder) {
  auto channel = channel::make_unbounded_channel<int>();
  auto& tx = channel.first;
  auto& rx = channel.second;
  CountingWaker waker;
  auto cx = waker.context();

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(tx.push(i));
  }
  EXPECT_EQ(rx.size(), 5u);

  for (int i = 0; i < 5; ++i) {
    auto polled = rx.poll_next(cx);
    ASSERT_TRUE(polled.is_ready());
    ASSERT_TRUE(polled.value().has_value());
    EXPECT_EQ(*polled.value(), i);
  }
  EXPECT_TRUE(rx.poll_next(cx).is_pending());
}

TEST(UnboundedChannelTest, PendingPollIsWokenByPush) {
  auto channel = channel::make_unbounded_channel<std::string>();
  CountingWaker waker;
  auto cx = waker.context();

  EXPECT_TRUE(channel.second.poll_next(cx).is_pending());
  EXPECT_EQ(waker.count(), 0);

  channel.first.push("hello");
  EXPECT_EQ(waker.count(), 1);

  // The registration is consumed by the first wake
  channel.first.push("again");
  EXPECT_EQ(waker.count(), 1);
}

TEST(UnboundedChannelTest, EndsAfterLastSenderIsGone) {
  auto channel = channel::make_unbounded_channel<int>();
  auto rx = std::move(channel.second);
  CountingWaker waker;
  auto cx = waker.context();

  {
    auto tx = std::move(channel.first);
    auto copy = tx;
    tx.push(7);
    tx.close();
    EXPECT_FALSE(rx.is_closed());
    EXPECT_TRUE(rx.poll_next(cx).is_ready());  // the queued 7
    EXPECT_TRUE(rx.poll_next(cx).is_pending());
  }

  EXPECT_EQ(waker.count(), 1);
  EXPECT_TRUE(rx.is_closed());
  auto end = rx.poll_next(cx);
  ASSERT_TRUE(end.is_ready());
  EXPECT_FALSE(end.value().has_value());
}

TEST(UnboundedChannelTest, QueuedValuesSurviveSenderClose) {
  auto channel = channel::make_unbounded_channel<int>();
  channel.first.push(1);
  channel.first.push(2);
  channel.first.close();

  EXPECT_EQ(channel.second.try_next(), 1);
  EXPECT_EQ(channel.second.try_next(), 2);
  EXPECT_EQ(channel.second.try_next(), std::nullopt);
}

TEST(UnboundedChannelTest, PushFailsOnceReceiverIsDropped) {
  auto channel = channel::make_unbounded_channel<int>();
  auto tx = std::move(channel.first);
  {
    auto rx = std::move(channel.second);
    EXPECT_TRUE(tx.is_receiver_alive());
  }
  EXPECT_FALSE(tx.is_receiver_alive());
  EXPECT_FALSE(tx.push(1));
}

TEST(UnboundedChannelTest, ConcurrentProducersKeepPerSenderOrder) {
  auto channel = channel::make_unbounded_channel<std::pair<int, int>>();
  constexpr int kPerThread = 500;

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([tx = channel.first, t]() mutable {
      for (int i = 0; i < kPerThread; ++i) {
        tx.push({t, i});
      }
    });
  }
  channel.first.close();
  for (auto& p : producers) p.join();

  std::vector<int> next(4, 0);
  int total = 0;
  while (auto item = channel.second.try_next()) {
    EXPECT_EQ(item->second, next[item->first]);
    ++next[item->first];
    ++total;
  }
  EXPECT_EQ(total, 4 * kPerThread);
  EXPECT_TRUE(channel.second.is_closed());
}
