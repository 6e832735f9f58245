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

#include <boost/asio.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "portshare/diagnostics/error_handler.hpp"
#include "test_utils.hpp"

using namespace portshare;
using namespace portshare::test;
using namespace portshare::diagnostics;

/**
 * @brief Error handler and error_reporting helper tests
 */
class ErrorHandlerTest : public BaseTest {};

// ============================================================================
// ERROR REPORTING
// ============================================================================

/**
 * @brief Over-release is a critical lifecycle error tied to its port
 */
TEST_F(ErrorHandlerTest, ReleaseWithoutHolderIsCritical) {
  error_reporting::report_release_without_holder(7);

  auto errors = ErrorHandler::instance().errors_for_port(7);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].level, ErrorLevel::CRITICAL);
  EXPECT_EQ(errors[0].category, ErrorCategory::LIFECYCLE);
  EXPECT_EQ(errors[0].code, ErrorCode::ReleaseWithoutHolder);
  EXPECT_FALSE(errors[0].retryable());
  EXPECT_EQ(ErrorHandler::instance().lifecycle_violations(), 1u);
  EXPECT_EQ(ErrorHandler::instance().get_error_stats().critical, 1u);
}

TEST_F(ErrorHandlerTest, BuildFailureKeepsCodeAndIsRetryable) {
  error_reporting::report_build_failure("tcp_server_builder", 8080, "address in use", ErrorCode::PortInUse);

  auto errors = ErrorHandler::instance().errors_for_port(8080);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].category, ErrorCategory::BUILD);
  EXPECT_EQ(errors[0].code, ErrorCode::PortInUse);
  EXPECT_TRUE(errors[0].retryable());
  EXPECT_EQ(ErrorHandler::instance().lifecycle_violations(), 0u);
}

TEST_F(ErrorHandlerTest, SocketErrorMapsBoostCode) {
  boost::system::error_code ec = boost::asio::error::address_in_use;
  error_reporting::report_socket_error(9000, "bind", ec);

  auto errors = ErrorHandler::instance().errors_for_port(9000);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].category, ErrorCategory::SOCKET);
  EXPECT_EQ(errors[0].component, "tcp_server");
  EXPECT_EQ(errors[0].operation, "bind");
  EXPECT_EQ(errors[0].boost_error, ec);
  EXPECT_EQ(errors[0].code, ErrorCode::PortInUse);
}

TEST_F(ErrorHandlerTest, ConfigurationErrorHasNoPort) {
  error_reporting::report_configuration_error("load", "bad yaml");

  auto errors = ErrorHandler::instance().get_recent_errors(1);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_FALSE(errors[0].port.has_value());
  EXPECT_EQ(errors[0].code, ErrorCode::InvalidConfiguration);
  EXPECT_TRUE(ErrorHandler::instance().errors_for_port(0).empty());
}

TEST_F(ErrorHandlerTest, StatsCountEachCategory) {
  error_reporting::report_release_without_holder(1);
  error_reporting::report_build_failure("registry", 2, "x");
  error_reporting::report_shutdown_failure(3, "stuck");
  error_reporting::report_configuration_error("parse", "y");

  auto stats = ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.total, 4u);
  EXPECT_EQ(stats.critical, 1u);
  EXPECT_EQ(stats.count(ErrorCategory::LIFECYCLE), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::BUILD), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::SHUTDOWN), 1u);
  EXPECT_EQ(stats.count(ErrorCategory::SOCKET), 0u);
  EXPECT_EQ(stats.count(ErrorCategory::CONFIGURATION), 1u);
}

// ============================================================================
// HANDLER BEHAVIOUR
// ============================================================================

TEST_F(ErrorHandlerTest, CallbacksReceiveErrors) {
  std::vector<uint16_t> ports;
  ErrorHandler::instance().register_callback([&ports](const ErrorInfo& info) {
    if (info.category == ErrorCategory::BUILD) ports.push_back(*info.port);
  });

  error_reporting::report_build_failure("registry", 1, "x");
  error_reporting::report_shutdown_failure(5, "ignored by the callback");
  error_reporting::report_build_failure("registry", 2, "y");

  EXPECT_EQ(ports, (std::vector<uint16_t>{1, 2}));
}

TEST_F(ErrorHandlerTest, ThrowingCallbackDoesNotBreakReporting) {
  ErrorHandler::instance().register_callback([](const ErrorInfo&) { throw std::runtime_error("callback failure"); });

  EXPECT_NO_THROW(error_reporting::report_build_failure("registry", 1, "x"));
  EXPECT_EQ(ErrorHandler::instance().get_error_stats().total, 1u);
}

TEST_F(ErrorHandlerTest, CallbackMayQueryHandler) {
  size_t seen = 0;
  ErrorHandler::instance().register_callback(
      [&seen](const ErrorInfo& info) { seen = ErrorHandler::instance().errors_for_port(*info.port).size(); });

  error_reporting::report_shutdown_failure(44, "a");
  error_reporting::report_shutdown_failure(44, "b");

  EXPECT_EQ(seen, 2u);
}

TEST_F(ErrorHandlerTest, RecentErrorsAreNewestLast) {
  for (uint16_t port = 1; port <= 5; ++port) {
    error_reporting::report_build_failure("registry", port, "x");
  }

  auto recent = ErrorHandler::instance().get_recent_errors(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].port, 4);
  EXPECT_EQ(recent[1].port, 5);
  EXPECT_EQ(ErrorHandler::instance().get_recent_errors(100).size(), 5u);
}

TEST_F(ErrorHandlerTest, ResetClearsHistory) {
  error_reporting::report_release_without_holder(3);
  ErrorHandler::instance().reset();

  EXPECT_EQ(ErrorHandler::instance().get_error_stats().total, 0u);
  EXPECT_TRUE(ErrorHandler::instance().errors_for_port(3).empty());
  EXPECT_EQ(ErrorHandler::instance().lifecycle_violations(), 0u);
}

TEST_F(ErrorHandlerTest, SummaryNamesPortAndCode) {
  error_reporting::report_release_without_holder(9);

  auto summary = ErrorHandler::instance().get_recent_errors(1).front().summary();
  EXPECT_EQ(summary, "[CRITICAL] registry/release port 9: release without a matching acquire (Release Without Holder)");
}
