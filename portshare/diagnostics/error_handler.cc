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

#include "portshare/diagnostics/error_handler.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

#include "portshare/diagnostics/logger.hpp"

namespace portshare {
namespace diagnostics {

ErrorHandler& ErrorHandler::instance() {
  // Leaked so servers shut down from static destructors can still report
  static ErrorHandler* handler = new ErrorHandler();
  return *handler;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  std::vector<ErrorCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.total;
    ++stats_.by_category[static_cast<size_t>(error.category)];
    if (error.level == ErrorLevel::CRITICAL) {
      ++stats_.critical;
    }
    history_.push_back(error);
    if (history_.size() > kMaxHistory) {
      history_.pop_front();
    }
    callbacks = callbacks_;
  }

  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Logged only; reporting it would recurse into the same callback
      PORTSHARE_LOG_ERROR("error_handler", "callback", "Error callback threw: " + std::string(e.what()));
    }
  }
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::vector<ErrorInfo> ErrorHandler::errors_for_port(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ErrorInfo> matching;
  std::copy_if(history_.begin(), history_.end(), std::back_inserter(matching),
               [port](const ErrorInfo& error) { return error.port == port; });
  return matching;
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto first = history_.size() > count ? history_.end() - static_cast<std::ptrdiff_t>(count) : history_.begin();
  return std::vector<ErrorInfo>(first, history_.end());
}

size_t ErrorHandler::lifecycle_violations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_.count(ErrorCategory::LIFECYCLE);
}

void ErrorHandler::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_ = ErrorStats{};
  history_.clear();
}

namespace error_reporting {

void report_release_without_holder(uint16_t port) {
  ErrorInfo error(ErrorCategory::LIFECYCLE, "registry", "release", "release without a matching acquire");
  error.level = ErrorLevel::CRITICAL;
  error.code = ErrorCode::ReleaseWithoutHolder;
  error.port = port;
  ErrorHandler::instance().report_error(error);
}

void report_build_failure(const std::string& component, uint16_t port, const std::string& message, ErrorCode code) {
  ErrorInfo error(ErrorCategory::BUILD, component, "build", message);
  error.code = code;
  error.port = port;
  ErrorHandler::instance().report_error(error);
}

void report_shutdown_failure(uint16_t port, const std::string& message) {
  ErrorInfo error(ErrorCategory::SHUTDOWN, "registry", "release", message);
  error.code = ErrorCode::ShutdownFailed;
  error.port = port;
  ErrorHandler::instance().report_error(error);
}

void report_socket_error(uint16_t port, const std::string& operation, const boost::system::error_code& ec) {
  ErrorInfo error(ErrorCategory::SOCKET, "tcp_server", operation, ec.message());
  error.port = port;
  error.boost_error = ec;
  if (ec == boost::system::errc::address_in_use) {
    error.code = ErrorCode::PortInUse;
  } else if (ec == boost::system::errc::permission_denied) {
    error.code = ErrorCode::AccessDenied;
  }
  ErrorHandler::instance().report_error(error);
}

void report_configuration_error(const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorCategory::CONFIGURATION, "config", operation, message);
  error.code = ErrorCode::InvalidConfiguration;
  ErrorHandler::instance().report_error(error);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace portshare
