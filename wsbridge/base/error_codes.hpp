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
#include <string>
#include <type_traits>

#include "wsbridge/base/visibility.hpp"

namespace wsbridge {

/**
 * @brief Structured error codes for wsbridge
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,
  InternalError,
  IoError,

  // Connection construction
  InvalidUrl,
  UnsupportedScheme,
  BlockedPort,
  InvalidProtocol,
  DuplicateProtocol,

  // Transport state and arguments
  InvalidState,
  MessageTooLarge,
  InvalidCloseCode,
  CloseReasonTooLong,

  // Adapter level
  ConnectionError,
  ConnectionClosed,
  SendFailed,
  CloseFailed,
  UnexpectedPayload,
  TransportContract
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
WSBRIDGE_API std::string to_string(ErrorCode code);

/**
 * @brief Error category bridging ErrorCode into boost::system
 */
WSBRIDGE_API const boost::system::error_category& wsbridge_category() noexcept;

WSBRIDGE_API boost::system::error_code make_error_code(ErrorCode code) noexcept;

}  // namespace wsbridge

namespace boost {
namespace system {
template <>
struct is_error_code_enum<wsbridge::ErrorCode> : std::true_type {};
}  // namespace system
}  // namespace boost
