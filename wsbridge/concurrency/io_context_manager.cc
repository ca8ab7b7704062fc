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

#include "wsbridge/concurrency/io_context_manager.hpp"

#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {
namespace concurrency {

IoContextManager::IoContextManager() {
  // Logger must outlive this manager; touching it here orders the statics
  diagnostics::Logger::instance();
}

IoContextManager::IoContextManager(std::shared_ptr<IoContext> external_context)
    : owns_context_(false), ioc_(std::move(external_context)) {
  diagnostics::Logger::instance();
}

IoContextManager& IoContextManager::instance() {
  static IoContextManager instance;
  return instance;
}

boost::asio::io_context& IoContextManager::get_context() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ioc_) {
    ioc_ = std::make_shared<IoContext>();
    owns_context_ = true;
  }
  return *ioc_;
}

void IoContextManager::start() {
  std::unique_lock<std::mutex> lock(mutex_);

  if (!owns_context_ && ioc_) {
    WSBRIDGE_LOG_DEBUG("io_context_manager", "start", "External io_context, thread creation skipped");
    return;
  }

  cv_.wait(lock, [this] { return !stopping_; });

  if (running_.load()) {
    return;
  }

  if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
    WSBRIDGE_LOG_ERROR("io_context_manager", "start", "Cannot restart from within the io thread");
    return;
  }

  if (!ioc_) {
    ioc_ = std::make_shared<IoContext>();
    owns_context_ = true;
  }
  if (ioc_->stopped()) {
    ioc_->restart();
  }
  work_guard_ = std::make_unique<WorkGuard>(ioc_->get_executor());

  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  auto context = ioc_;
  io_thread_ = std::thread([this, context]() {
    WSBRIDGE_LOG_DEBUG("io_context_manager", "run", "io thread started");
    try {
      context->run();
    } catch (const std::exception& e) {
      WSBRIDGE_LOG_ERROR("io_context_manager", "run", std::string("io thread error: ") + e.what());
      diagnostics::error_reporting::report_system_error("io_context_manager", "run", e.what());
    }
    WSBRIDGE_LOG_DEBUG("io_context_manager", "run", "io thread finished");
    running_.store(false);
  });
  running_.store(true);
}

void IoContextManager::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owns_context_ && ioc_) {
      return;
    }
    if (!running_.load() && !io_thread_.joinable()) {
      return;
    }

    if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
      WSBRIDGE_LOG_ERROR("io_context_manager", "stop", "Cannot join the io thread from within itself");
      return;
    }

    stopping_ = true;
    work_guard_.reset();
    if (ioc_) {
      ioc_->stop();
    }
    worker = std::move(io_thread_);
  }

  if (worker.joinable()) {
    worker.join();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
    running_.store(false);
  }
  cv_.notify_all();
}

bool IoContextManager::is_running() const { return running_.load(); }

IoContextManager::~IoContextManager() {
  try {
    stop();
  } catch (const std::exception& e) {
    WSBRIDGE_LOG_ERROR("io_context_manager", "destroy", std::string("Failed to stop: ") + e.what());
  }
}

}  // namespace concurrency
}  // namespace wsbridge
