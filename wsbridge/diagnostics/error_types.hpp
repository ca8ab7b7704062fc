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

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

namespace wsbridge {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational
  WARNING = 1,  // Recoverable issue
  ERROR = 2,    // Operation failed, surfaced to the caller
  CRITICAL = 3  // Failure with no caller to surface it to
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  CONNECTION = 0,     // Opening, handshaking, dropping a connection
  COMMUNICATION = 1,  // Sending or receiving messages
  CONFIGURATION = 2,  // Invalid URL, sub-protocol or config values
  PROTOCOL = 3,       // Transport broke its contract with the adapter
  SYSTEM = 4,         // OS or library level failures
  UNKNOWN = 5
};

constexpr size_t ERROR_LEVEL_COUNT = 4;
constexpr size_t ERROR_CATEGORY_COUNT = 6;

/**
 * @brief Error information reported to the ErrorHandler
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;  // adapter, event_relay, beast_transport, ...
  std::string operation;  // open, send, close, ...
  std::string message;
  boost::system::error_code error_code;
  std::chrono::system_clock::time_point timestamp;

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec = boost::system::error_code{})
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        error_code(ec),
        timestamp(std::chrono::system_clock::now()) {}

  std::string get_timestamp_string() const {
    auto tt = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()) % 1000;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
  }

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::CONNECTION:
        return "CONNECTION";
      case ErrorCategory::COMMUNICATION:
        return "COMMUNICATION";
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::PROTOCOL:
        return "PROTOCOL";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
      case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
  }

  /**
   * @brief One-line summary, e.g. "[ERROR] [adapter] [send] ... (code: wsbridge:11 Invalid State)"
   */
  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] [" << component << "] [" << operation << "] " << message;
    if (error_code) {
      oss << " (code: " << error_code.category().name() << ":" << error_code.value() << " " << error_code.message()
          << ")";
    }
    return oss.str();
  }
};

/**
 * @brief Error statistics for monitoring
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[ERROR_LEVEL_COUNT] = {0, 0, 0, 0};
  size_t errors_by_category[ERROR_CATEGORY_COUNT] = {0, 0, 0, 0, 0, 0};

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }

  size_t count(ErrorLevel level) const { return errors_by_level[static_cast<size_t>(level)]; }
  size_t count(ErrorCategory category) const { return errors_by_category[static_cast<size_t>(category)]; }
};

}  // namespace diagnostics
}  // namespace wsbridge
