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

#include <any>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "test/utils/test_utils.hpp"
#include "wsbridge/base/constants.hpp"
#include "wsbridge/config/config_factory.hpp"
#include "wsbridge/config/config_manager.hpp"
#include "wsbridge/config/websocket_config.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/logger.hpp"

using namespace wsbridge;
using namespace wsbridge::config;
using wsbridge::test::TestUtils;
namespace constants = wsbridge::base::constants;

TEST(WebSocketConfigTest, DefaultsAreValid) {
  WebSocketConfig cfg;
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_EQ(cfg.handshake_timeout_ms, constants::DEFAULT_HANDSHAKE_TIMEOUT_MS);
  EXPECT_EQ(cfg.max_message_size, constants::DEFAULT_MAX_MESSAGE_SIZE);
  EXPECT_EQ(cfg.user_agent, "wsbridge");
  EXPECT_TRUE(cfg.tcp_no_delay);
}

TEST(WebSocketConfigTest, ClampBringsValuesIntoRange) {
  WebSocketConfig cfg;
  cfg.handshake_timeout_ms = 1;
  cfg.max_message_size = constants::MAX_MAX_MESSAGE_SIZE + 1;
  cfg.user_agent.assign(constants::MAX_USER_AGENT_LENGTH + 10, 'a');
  EXPECT_FALSE(cfg.is_valid());

  cfg.validate_and_clamp();
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_EQ(cfg.handshake_timeout_ms, constants::MIN_HANDSHAKE_TIMEOUT_MS);
  EXPECT_EQ(cfg.max_message_size, constants::MAX_MAX_MESSAGE_SIZE);
  EXPECT_EQ(cfg.user_agent.size(), constants::MAX_USER_AGENT_LENGTH);
}

class ConfigFactoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    file_ = TestUtils::makeTempFilePath("wsbridge_config_factory_" +
                                        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                                        ".conf");
    diagnostics::ErrorHandler::instance().reset_stats();
    saved_level_ = diagnostics::Logger::instance().get_level();
    saved_outputs_ = diagnostics::Logger::instance().get_outputs();
  }

  void TearDown() override {
    TestUtils::removeFileIfExists(file_);
    auto& logger = diagnostics::Logger::instance();
    logger.set_file_output("");
    logger.set_format("{timestamp} [{level}] [{component}] [{operation}] {message}");
    logger.set_level(saved_level_);
    logger.set_outputs(saved_outputs_);
  }

  std::filesystem::path file_;
  diagnostics::LogLevel saved_level_ = diagnostics::LogLevel::INFO;
  int saved_outputs_ = 0;
};

TEST_F(ConfigFactoryTest, DefaultsMatchWebSocketConfig) {
  auto config = ConfigFactory::create_with_defaults();
  ASSERT_TRUE(config->validate().is_valid);

  EXPECT_EQ(std::any_cast<int>(config->get("websocket.handshake_timeout_ms")),
            static_cast<int>(constants::DEFAULT_HANDSHAKE_TIMEOUT_MS));
  EXPECT_EQ(std::any_cast<std::string>(config->get("logging.level")), "info");
  EXPECT_FALSE(std::any_cast<bool>(config->get("logging.enable_file")));

  auto cfg = to_websocket_config(*config);
  WebSocketConfig defaults;
  EXPECT_EQ(cfg.handshake_timeout_ms, defaults.handshake_timeout_ms);
  EXPECT_EQ(cfg.max_message_size, defaults.max_message_size);
  EXPECT_EQ(cfg.user_agent, defaults.user_agent);
  EXPECT_EQ(cfg.tcp_no_delay, defaults.tcp_no_delay);
}

TEST_F(ConfigFactoryTest, PresetValidatorsRejectOutOfRangeValues) {
  auto config = ConfigFactory::create_with_defaults();

  EXPECT_FALSE(config->set("websocket.handshake_timeout_ms", 5).is_valid);
  EXPECT_FALSE(config->set("websocket.max_message_size", 10).is_valid);
  EXPECT_FALSE(config->set("websocket.user_agent", std::string(constants::MAX_USER_AGENT_LENGTH + 1, 'x')).is_valid);
  EXPECT_FALSE(config->set("websocket.tcp_no_delay", 1).is_valid);

  EXPECT_TRUE(config->set("websocket.max_message_size", 2048).is_valid);
  EXPECT_EQ(to_websocket_config(*config).max_message_size, 2048u);
}

TEST_F(ConfigFactoryTest, UnregisteredOutOfRangeValuesAreClamped) {
  auto config = ConfigFactory::create();
  ASSERT_TRUE(config->set("websocket.max_message_size", 10).is_valid);
  ASSERT_TRUE(config->set("websocket.handshake_timeout_ms", -5).is_valid);

  auto cfg = to_websocket_config(*config);
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_EQ(cfg.max_message_size, constants::MIN_MAX_MESSAGE_SIZE);
  EXPECT_EQ(cfg.handshake_timeout_ms, constants::MIN_HANDSHAKE_TIMEOUT_MS);
  EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("config_factory"));
}

TEST_F(ConfigFactoryTest, WrongTypedValueFallsBackToDefault) {
  auto config = ConfigFactory::create();
  ASSERT_TRUE(config->set("websocket.user_agent", 42).is_valid);
  EXPECT_EQ(to_websocket_config(*config).user_agent, "wsbridge");
}

TEST_F(ConfigFactoryTest, CreateFromFileOverlaysDefaults) {
  {
    std::ofstream out(file_);
    out << "# overrides\n"
        << "websocket.handshake_timeout_ms=2500\n"
        << "websocket.user_agent=probe/2.0\n"
        << "websocket.max_message_size=1\n";
  }

  auto config = ConfigFactory::create_from_file(file_.string());
  auto cfg = to_websocket_config(*config);
  EXPECT_EQ(cfg.handshake_timeout_ms, 2500u);
  EXPECT_EQ(cfg.user_agent, "probe/2.0");
  // Rejected by the preset validator, default kept
  EXPECT_EQ(cfg.max_message_size, constants::DEFAULT_MAX_MESSAGE_SIZE);
}

TEST_F(ConfigFactoryTest, CreateFromMissingFileKeepsDefaults) {
  auto config = ConfigFactory::create_from_file("/nonexistent-dir/wsbridge.conf");
  EXPECT_TRUE(config->has("websocket.user_agent"));
  EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("config_factory"));
}

TEST_F(ConfigFactoryTest, ApplyLoggingConfigDrivesLogger) {
  auto config = ConfigFactory::create_with_defaults();
  ASSERT_TRUE(config->set("logging.level", std::string("error")).is_valid);
  ASSERT_TRUE(config->set("logging.enable_console", false).is_valid);
  ASSERT_TRUE(config->set("logging.format", std::string("{level}:{message}")).is_valid);

  apply_logging_config(*config);

  auto& logger = diagnostics::Logger::instance();
  EXPECT_EQ(logger.get_level(), diagnostics::LogLevel::ERROR);
  EXPECT_FALSE(logger.get_outputs() & static_cast<int>(diagnostics::LogOutput::CONSOLE));
  EXPECT_FALSE(logger.get_outputs() & static_cast<int>(diagnostics::LogOutput::FILE));

  std::string line;
  logger.set_callback([&line](diagnostics::LogLevel, const std::string& formatted) { line = formatted; });
  logger.error("c", "op", "formatted");
  logger.set_callback(nullptr);
  EXPECT_EQ(line, "ERROR:formatted");
}

TEST_F(ConfigFactoryTest, ApplyLoggingConfigOpensLogFile) {
  auto config = ConfigFactory::create_with_defaults();
  ASSERT_TRUE(config->set("logging.enable_file", true).is_valid);
  ASSERT_TRUE(config->set("logging.file_path", file_.string()).is_valid);
  ASSERT_TRUE(config->set("logging.enable_console", false).is_valid);

  apply_logging_config(*config);
  EXPECT_TRUE(diagnostics::Logger::instance().get_outputs() & static_cast<int>(diagnostics::LogOutput::FILE));
  EXPECT_TRUE(std::filesystem::exists(file_));
}
