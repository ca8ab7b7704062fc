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

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "wsbridge/base/visibility.hpp"

namespace wsbridge {
namespace concurrency {

/**
 * Shared io_context runner
 *
 * Every Beast transport created by the default factory runs on the
 * io_context owned here, driven by one background thread.
 */
class WSBRIDGE_API IoContextManager {
 public:
  using IoContext = boost::asio::io_context;
  using WorkGuard = boost::asio::executor_work_guard<IoContext::executor_type>;

  static IoContextManager& instance();

  IoContextManager();
  explicit IoContextManager(std::shared_ptr<IoContext> external_context);
  ~IoContextManager();

  IoContext& get_context();

  /**
   * @brief Start the io thread (no-op for external contexts or when already running)
   */
  void start();

  /**
   * @brief Stop and join the io thread; pending handlers are dropped
   */
  void stop();

  bool is_running() const;

 private:
  IoContextManager(const IoContextManager&) = delete;
  IoContextManager& operator=(const IoContextManager&) = delete;

  bool owns_context_{true};
  std::shared_ptr<IoContext> ioc_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_{false};
};

}  // namespace concurrency
}  // namespace wsbridge
