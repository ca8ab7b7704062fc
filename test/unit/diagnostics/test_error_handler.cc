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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "wsbridge/base/constants.hpp"
#include "wsbridge/base/error_codes.hpp"
#include "wsbridge/diagnostics/error_handler.hpp"
#include "wsbridge/diagnostics/logger.hpp"

using namespace wsbridge;
using namespace wsbridge::diagnostics;

class ErrorHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& handler = ErrorHandler::instance();
    handler.reset_stats();
    handler.clear_callbacks();
    handler.set_enabled(true);
    handler.set_min_error_level(ErrorLevel::INFO);
    // Keep the callback test output readable
    saved_console_ = Logger::instance().get_outputs();
    Logger::instance().set_console_output(false);
  }

  void TearDown() override {
    auto& handler = ErrorHandler::instance();
    handler.clear_callbacks();
    handler.set_enabled(true);
    handler.set_min_error_level(ErrorLevel::INFO);
    handler.reset_stats();
    Logger::instance().set_outputs(saved_console_);
  }

  int saved_console_ = 0;
};

TEST_F(ErrorHandlerTest, ConstructionErrorIsConfigurationCategory) {
  error_reporting::report_construction_error("transport_factory", "open", make_error_code(ErrorCode::InvalidUrl),
                                             "ftp://example.com");

  auto errors = ErrorHandler::instance().get_errors_by_component("transport_factory");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].level, ErrorLevel::ERROR);
  EXPECT_EQ(errors[0].category, ErrorCategory::CONFIGURATION);
  EXPECT_EQ(errors[0].operation, "open");
  EXPECT_EQ(errors[0].message, "Invalid URL: ftp://example.com");
  EXPECT_EQ(errors[0].error_code, make_error_code(ErrorCode::InvalidUrl));
}

TEST_F(ErrorHandlerTest, ReportingHelpersClassifyFailures) {
  error_reporting::report_connection_error("c", "connect", make_error_code(ErrorCode::ConnectionError));
  error_reporting::report_send_error("c", make_error_code(ErrorCode::MessageTooLarge));
  error_reporting::report_close_error("c", make_error_code(ErrorCode::InvalidCloseCode));
  error_reporting::report_contract_violation("c", "state", "ready state 7");
  error_reporting::report_configuration_error("c", "load", "bad value");
  error_reporting::report_system_error("c", "run", "thread died");
  error_reporting::report_warning("c", "load", "missing file");

  auto stats = ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.total_errors, 7u);
  EXPECT_EQ(stats.count(ErrorCategory::CONNECTION), 2u);
  EXPECT_EQ(stats.count(ErrorCategory::COMMUNICATION), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::PROTOCOL), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::CONFIGURATION), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::SYSTEM), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::UNKNOWN), 1u);
  EXPECT_EQ(stats.count(ErrorLevel::CRITICAL), 1u);
  EXPECT_EQ(stats.count(ErrorLevel::WARNING), 1u);
  EXPECT_EQ(stats.count(ErrorLevel::ERROR), 5u);

  auto errors = ErrorHandler::instance().get_errors_by_component("c");
  ASSERT_EQ(errors.size(), 7u);
  EXPECT_EQ(errors[1].operation, "send");
  EXPECT_EQ(errors[2].operation, "close");
  EXPECT_EQ(errors[3].error_code, make_error_code(ErrorCode::TransportContract));
}

TEST_F(ErrorHandlerTest, MinLevelFiltersReports) {
  auto& handler = ErrorHandler::instance();
  handler.set_min_error_level(ErrorLevel::CRITICAL);

  error_reporting::report_warning("filtered", "op", "w");
  error_reporting::report_connection_error("filtered", "op", make_error_code(ErrorCode::ConnectionError));
  EXPECT_FALSE(handler.has_errors("filtered"));

  error_reporting::report_contract_violation("filtered", "op", "kept");
  EXPECT_TRUE(handler.has_errors("filtered"));
  EXPECT_EQ(handler.get_error_count("filtered", ErrorLevel::CRITICAL), 1u);
}

TEST_F(ErrorHandlerTest, DisabledHandlerRecordsNothing) {
  auto& handler = ErrorHandler::instance();
  handler.set_enabled(false);
  error_reporting::report_system_error("disabled", "op", "m");
  EXPECT_FALSE(handler.has_errors("disabled"));
  EXPECT_EQ(handler.get_error_stats().total_errors, 0u);
}

TEST_F(ErrorHandlerTest, CallbacksSeeEveryReport) {
  auto& handler = ErrorHandler::instance();
  std::vector<std::string> operations;
  handler.register_callback([&operations](const ErrorInfo& info) { operations.push_back(info.operation); });
  handler.register_callback([](const ErrorInfo&) { throw std::runtime_error("callback failure"); });

  error_reporting::report_send_error("cb", make_error_code(ErrorCode::InvalidState));
  error_reporting::report_close_error("cb", make_error_code(ErrorCode::CloseReasonTooLong));

  EXPECT_THAT(operations, ::testing::ElementsAre("send", "close"));
  EXPECT_EQ(handler.get_error_count("cb", ErrorLevel::ERROR), 2u);
}

TEST_F(ErrorHandlerTest, RecentErrorsAreBounded) {
  auto& handler = ErrorHandler::instance();
  const size_t total = base::constants::DEFAULT_MAX_RECENT_ERRORS + 5;
  for (size_t i = 0; i < total; ++i) {
    error_reporting::report_warning("bounded", "op", std::to_string(i));
  }

  auto all = handler.get_recent_errors(total);
  ASSERT_EQ(all.size(), base::constants::DEFAULT_MAX_RECENT_ERRORS);
  EXPECT_EQ(all.back().message, std::to_string(total - 1));

  auto last_two = handler.get_recent_errors(2);
  ASSERT_EQ(last_two.size(), 2u);
  EXPECT_EQ(last_two[0].message, std::to_string(total - 2));

  EXPECT_LE(handler.get_errors_by_component("bounded").size(), base::constants::DEFAULT_MAX_COMPONENT_ERRORS);
}

TEST_F(ErrorHandlerTest, ConcurrentReportsAreCounted) {
  auto& handler = ErrorHandler::instance();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([]() {
      for (int i = 0; i < 50; ++i) {
        error_reporting::report_send_error("concurrent", make_error_code(ErrorCode::SendFailed));
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(handler.get_error_stats().count(ErrorCategory::COMMUNICATION), 200u);
}

TEST_F(ErrorHandlerTest, ResetClearsHistory) {
  auto& handler = ErrorHandler::instance();
  error_reporting::report_warning("reset", "op", "m");
  ASSERT_TRUE(handler.has_errors("reset"));

  handler.reset_stats();
  EXPECT_FALSE(handler.has_errors("reset"));
  EXPECT_TRUE(handler.get_recent_errors().empty());
  EXPECT_EQ(handler.get_error_stats().total_errors, 0u);
}
