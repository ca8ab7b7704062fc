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
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "wsbridge/base/visibility.hpp"
#include "wsbridge/diagnostics/error_types.hpp"

namespace wsbridge {
namespace diagnostics {

/**
 * @brief Centralized error handling system
 *
 * Collects every failure the library surfaces (or cannot surface), keeps
 * statistics and a bounded history, and fans reports out to callbacks.
 */
class WSBRIDGE_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  /**
   * @brief Get singleton instance
   */
  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  /**
   * @brief Report an error
   * @param error Error information to report
   */
  void report_error(const ErrorInfo& error);

  /**
   * @brief Register error callback
   * @param callback Function to call when errors occur
   */
  void register_callback(ErrorCallback callback);

  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Minimum level (errors below this level are ignored)
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;

  /**
   * @brief Reset statistics and drop the recorded history
   */
  void reset_stats();

  /**
   * @brief Get errors by component
   * @param component Component name to filter by
   */
  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  bool has_errors(const std::string& component) const;

  size_t get_error_count(const std::string& component, ErrorLevel level) const;

 private:
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;
  std::unordered_map<std::string, std::vector<ErrorInfo>> errors_by_component_;

  void update_stats(const ErrorInfo& error);
  void add_to_history(const ErrorInfo& error);
};

/**
 * @brief Convenience functions for the library's reporting sites
 */
namespace error_reporting {

/**
 * @brief Report a failure to construct a connection (bad URL, blocked port, bad sub-protocol)
 */
WSBRIDGE_API void report_construction_error(const std::string& component, const std::string& operation,
                                            const boost::system::error_code& ec, const std::string& detail = "");

/**
 * @brief Report a connection-level failure (handshake, dropped connection, error event)
 */
WSBRIDGE_API void report_connection_error(const std::string& component, const std::string& operation,
                                          const boost::system::error_code& ec);

/**
 * @brief Report a message the transport refused to send
 */
WSBRIDGE_API void report_send_error(const std::string& component, const boost::system::error_code& ec);

/**
 * @brief Report a rejected close request
 */
WSBRIDGE_API void report_close_error(const std::string& component, const boost::system::error_code& ec);

/**
 * @brief Report a transport that broke the adapter's contract (critical)
 */
WSBRIDGE_API void report_contract_violation(const std::string& component, const std::string& operation,
                                            const std::string& message);

WSBRIDGE_API void report_configuration_error(const std::string& component, const std::string& operation,
                                             const std::string& message);

WSBRIDGE_API void report_system_error(const std::string& component, const std::string& operation,
                                      const std::string& message,
                                      const boost::system::error_code& ec = boost::system::error_code{});

WSBRIDGE_API void report_warning(const std::string& component, const std::string& operation,
                                 const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace wsbridge
