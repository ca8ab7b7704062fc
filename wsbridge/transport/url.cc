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

#include "wsbridge/transport/url.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>

#include "wsbridge/base/constants.hpp"
#include "wsbridge/base/error_codes.hpp"

namespace wsbridge {
namespace transport {

namespace {

// https://fetch.spec.whatwg.org/#port-blocking
constexpr std::array<uint16_t, 81> kBlockedPorts = {
    0,    1,    7,    9,    11,   13,   15,   17,   19,   20,   21,   22,   23,   25,   37,   42,   43,
    53,   69,   77,   79,   87,   95,   101,  102,  103,  104,  109,  110,  111,  113,  115,  117,  119,
    123,  135,  137,  139,  143,  161,  179,  389,  427,  465,  512,  513,  514,  515,  526,  530,  531,
    532,  540,  548,  554,  556,  563,  587,  601,  636,  989,  990,  993,  995,  1719, 1720, 1723, 2049,
    3659, 4045, 4190, 5060, 5061, 6000, 6566, 6665, 6666, 6667, 6668, 6669, 6679};

constexpr std::array<uint16_t, 2> kBlockedHighPorts = {6697, 10080};

bool is_tchar(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) return true;
  switch (c) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

bool is_host_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_';
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

std::string Url::host_header() const {
  const bool ipv6 = host.find(':') != std::string::npos;
  std::string result = ipv6 ? "[" + host + "]" : host;
  const uint16_t default_port = secure ? base::constants::DEFAULT_WSS_PORT : base::constants::DEFAULT_WS_PORT;
  if (port != default_port) {
    result += ":" + std::to_string(port);
  }
  return result;
}

bool is_blocked_port(uint16_t port) {
  return std::find(kBlockedPorts.begin(), kBlockedPorts.end(), port) != kBlockedPorts.end() ||
         std::find(kBlockedHighPorts.begin(), kBlockedHighPorts.end(), port) != kBlockedHighPorts.end();
}

Url parse_websocket_url(const std::string& url, boost::system::error_code& ec) {
  ec.clear();
  Url result;

  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return {};
  }

  result.scheme = to_lower(url.substr(0, scheme_end));
  if (result.scheme == "ws") {
    result.secure = false;
  } else if (result.scheme == "wss") {
    result.secure = true;
  } else {
    ec = make_error_code(ErrorCode::UnsupportedScheme);
    return {};
  }

  if (url.find('#') != std::string::npos) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return {};
  }

  const auto authority_begin = scheme_end + 3;
  const auto authority_end = url.find_first_of("/?", authority_begin);
  const std::string authority = url.substr(authority_begin, authority_end == std::string::npos
                                                                ? std::string::npos
                                                                : authority_end - authority_begin);
  if (authority.empty() || authority.find('@') != std::string::npos) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return {};
  }

  std::string port_str;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos || close == 1) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return {};
    }
    result.host = authority.substr(1, close - 1);
    const std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        ec = make_error_code(ErrorCode::InvalidUrl);
        return {};
      }
      port_str = rest.substr(1);
    }
    const bool valid_v6 = std::all_of(result.host.begin(), result.host.end(), [](char c) {
      return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
    });
    if (!valid_v6) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return {};
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      port_str = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
    result.host = to_lower(result.host);
    if (result.host.empty() || result.host.size() > base::constants::MAX_HOSTNAME_LENGTH ||
        !std::all_of(result.host.begin(), result.host.end(), is_host_char)) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return {};
    }
  }

  if (port_str.empty()) {
    result.port = result.secure ? base::constants::DEFAULT_WSS_PORT : base::constants::DEFAULT_WS_PORT;
  } else {
    if (port_str.size() > 5 || !std::all_of(port_str.begin(), port_str.end(),
                                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return {};
    }
    const unsigned long value = std::stoul(port_str);
    if (value > 65535) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return {};
    }
    result.port = static_cast<uint16_t>(value);
  }

  if (is_blocked_port(result.port)) {
    ec = make_error_code(ErrorCode::BlockedPort);
    return {};
  }

  result.target = authority_end == std::string::npos ? "/" : url.substr(authority_end);
  if (result.target.front() == '?') {
    result.target.insert(result.target.begin(), '/');
  }
  return result;
}

void validate_protocols(const std::vector<std::string>& protocols, boost::system::error_code& ec) {
  ec.clear();
  std::set<std::string> seen;
  for (const auto& protocol : protocols) {
    if (protocol.empty() || !std::all_of(protocol.begin(), protocol.end(), is_tchar)) {
      ec = make_error_code(ErrorCode::InvalidProtocol);
      return;
    }
    if (!seen.insert(protocol).second) {
      ec = make_error_code(ErrorCode::DuplicateProtocol);
      return;
    }
  }
}

std::string join_protocols(const std::vector<std::string>& protocols) {
  std::string joined;
  for (const auto& protocol : protocols) {
    if (!joined.empty()) joined += ", ";
    joined += protocol;
  }
  return joined;
}

}  // namespace transport
}  // namespace wsbridge
