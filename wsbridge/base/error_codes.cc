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

#include "wsbridge/base/error_codes.hpp"

namespace wsbridge {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::InternalError:
      return "Internal Error";
    case ErrorCode::IoError:
      return "I/O Error";
    case ErrorCode::InvalidUrl:
      return "Invalid URL";
    case ErrorCode::UnsupportedScheme:
      return "Unsupported URL Scheme";
    case ErrorCode::BlockedPort:
      return "Port Is Blocked";
    case ErrorCode::InvalidProtocol:
      return "Invalid Sub-Protocol";
    case ErrorCode::DuplicateProtocol:
      return "Duplicate Sub-Protocol";
    case ErrorCode::InvalidState:
      return "Invalid State";
    case ErrorCode::MessageTooLarge:
      return "Message Too Large";
    case ErrorCode::InvalidCloseCode:
      return "Invalid Close Code";
    case ErrorCode::CloseReasonTooLong:
      return "Close Reason Too Long";
    case ErrorCode::ConnectionError:
      return "Connection Error";
    case ErrorCode::ConnectionClosed:
      return "Connection Closed";
    case ErrorCode::SendFailed:
      return "Send Failed";
    case ErrorCode::CloseFailed:
      return "Close Failed";
    case ErrorCode::UnexpectedPayload:
      return "Unexpected Payload";
    case ErrorCode::TransportContract:
      return "Transport Contract Violation";
  }
  return "Unknown Error Code";
}

namespace {

class WsBridgeCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "wsbridge"; }
  std::string message(int ev) const override { return to_string(static_cast<ErrorCode>(ev)); }
};

}  // namespace

const boost::system::error_category& wsbridge_category() noexcept {
  static const WsBridgeCategory category;
  return category;
}

boost::system::error_code make_error_code(ErrorCode code) noexcept {
  return boost::system::error_code(static_cast<int>(code), wsbridge_category());
}

}  // namespace wsbridge
