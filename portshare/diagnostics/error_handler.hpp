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

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "portshare/base/visibility.hpp"
#include "portshare/diagnostics/error_types.hpp"

namespace portshare {
namespace diagnostics {

/**
 * @brief Process-wide sink for registry, builder and server failures
 *
 * Keeps counters and a bounded history that tests can query by port, and
 * forwards every error to registered callbacks. Callbacks run on the
 * reporting thread with no portshare lock held.
 */
class PORTSHARE_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  static ErrorHandler& instance();

  ErrorHandler() = default;
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  void report_error(const ErrorInfo& error);

  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  ErrorStats get_error_stats() const;

  /**
   * @brief Errors recorded for a requested port, oldest first
   */
  std::vector<ErrorInfo> errors_for_port(uint16_t port) const;

  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  /**
   * @brief Number of release-without-holder reports since the last reset
   */
  size_t lifecycle_violations() const;

  /**
   * @brief Clear counters and history; callbacks stay registered
   */
  void reset();

 private:
  static constexpr size_t kMaxHistory = 256;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  ErrorStats stats_;
  std::deque<ErrorInfo> history_;
};

namespace error_reporting {

PORTSHARE_API void report_release_without_holder(uint16_t port);

/**
 * @brief A builder failed, threw, or returned no server for the port
 * @param code BuildFailed unless the cause is known (PortInUse, AccessDenied, ...)
 */
PORTSHARE_API void report_build_failure(const std::string& component, uint16_t port, const std::string& message,
                                        ErrorCode code = ErrorCode::BuildFailed);

PORTSHARE_API void report_shutdown_failure(uint16_t port, const std::string& message);

/**
 * @brief A socket step of the bundled TCP server failed
 * @param port Requested port of the server
 * @param operation open, bind, listen or accept
 */
PORTSHARE_API void report_socket_error(uint16_t port, const std::string& operation,
                                       const boost::system::error_code& ec);

PORTSHARE_API void report_configuration_error(const std::string& operation, const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace portshare
