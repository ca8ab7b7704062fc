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

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

namespace wsbridge {
namespace diagnostics {

/**
 * @brief Base exception class for all wsbridge exceptions
 *
 * Carries the component and operation that failed and, where a transport or
 * library error caused the failure, the originating error code.
 */
class WsBridgeException : public std::runtime_error {
 public:
  explicit WsBridgeException(const std::string& message, const std::string& component = "",
                             const std::string& operation = "",
                             const boost::system::error_code& ec = boost::system::error_code{})
      : std::runtime_error(message), component_(component), operation_(operation), code_(ec) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }
  const boost::system::error_code& code() const noexcept { return code_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    if (code_) {
      full_msg += " (code: " + std::to_string(code_.value()) + ", " + code_.message() + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
  boost::system::error_code code_;
};

/**
 * @brief The transport could not be constructed for the given URL or sub-protocols
 */
class ConstructionException : public WsBridgeException {
 public:
  ConstructionException(const std::string& message, const std::string& url, const boost::system::error_code& ec)
      : WsBridgeException(message, "websocket", "open", ec), url_(url) {}

  const std::string& get_url() const noexcept { return url_; }

 private:
  std::string url_;
};

/**
 * @brief The transport refused to transmit a message
 */
class SendException : public WsBridgeException {
 public:
  SendException(const std::string& message, const boost::system::error_code& ec)
      : WsBridgeException(message, "websocket", "send", ec) {}
};

/**
 * @brief The transport rejected a close request (invalid code or reason)
 */
class CloseException : public WsBridgeException {
 public:
  CloseException(const std::string& message, const boost::system::error_code& ec)
      : WsBridgeException(message, "websocket", "close", ec) {}
};

/**
 * @brief The transport reported something outside its contract
 */
class TransportContractException : public WsBridgeException {
 public:
  TransportContractException(const std::string& message, const std::string& operation)
      : WsBridgeException(message, "websocket", operation) {}
};

/**
 * @brief Exception thrown during builder operations
 */
class BuilderException : public WsBridgeException {
 public:
  explicit BuilderException(const std::string& message, const std::string& operation = "")
      : WsBridgeException(message, "builder", operation) {}
};

}  // namespace diagnostics
}  // namespace wsbridge
