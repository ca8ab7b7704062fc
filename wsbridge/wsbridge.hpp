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

#include <string>

#include "wsbridge/base/visibility.hpp"

// Adapter API
#include "wsbridge/adapter/async_ops.hpp"
#include "wsbridge/adapter/websocket.hpp"
#include "wsbridge/adapter/websocket_error.hpp"
#include "wsbridge/message/message.hpp"
#include "wsbridge/poll/poll.hpp"
#include "wsbridge/poll/waker.hpp"

// Builder API
#include "wsbridge/builder/websocket_builder.hpp"

// Bundled transport
#include "wsbridge/interface/websocket_transport.hpp"
#include "wsbridge/transport/beast_transport_factory.hpp"

// Configuration Management API (optional)
#ifdef WSBRIDGE_ENABLE_CONFIG
#include "wsbridge/config/config_factory.hpp"
#include "wsbridge/config/config_manager.hpp"
#include "wsbridge/config/iconfig_manager.hpp"
#endif

// Error handling and logging
#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/exceptions.hpp"
#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {

using adapter::StreamItem;
using adapter::WebSocket;
using adapter::WebSocketError;
using adapter::WebSocketSink;
using adapter::WebSocketStream;
using base::ConnectionState;
using message::CloseEvent;
using message::Message;

/**
 * @brief Create a WebSocket builder
 * @param url The ws:// URL to connect to
 * @return WebSocketBuilder A builder for the connection
 */
inline builder::WebSocketBuilder websocket(const std::string& url) { return builder::WebSocketBuilder(url); }

}  // namespace wsbridge
