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
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "portshare/base/error_codes.hpp"

#ifdef ERROR
#undef ERROR
#endif

namespace portshare {
namespace diagnostics {

enum class ErrorLevel {
  ERROR = 0,    // A server could not be built, bound or shut down
  CRITICAL = 1  // The acquire/release contract was broken
};

/**
 * @brief What part of a shared server's life the error belongs to
 */
enum class ErrorCategory {
  LIFECYCLE = 0,     // acquire/release bookkeeping
  BUILD = 1,         // builder could not produce a running server
  SHUTDOWN = 2,      // last release could not stop the server
  SOCKET = 3,        // open/bind/listen/accept on the server socket
  CONFIGURATION = 4  // config file or values
};

constexpr size_t kErrorCategoryCount = 5;

/**
 * @brief One reported failure, keyed by the requested port when there is one
 */
struct ErrorInfo {
  ErrorLevel level = ErrorLevel::ERROR;
  ErrorCategory category;
  ErrorCode code = ErrorCode::Unknown;
  std::string component;
  std::string operation;
  std::string message;
  std::optional<uint16_t> port;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

  ErrorInfo(ErrorCategory c, std::string comp, std::string op, std::string msg)
      : category(c), component(std::move(comp)), operation(std::move(op)), message(std::move(msg)) {}

  // A later acquire of the same port builds afresh, so only build and bind failures are worth retrying
  bool retryable() const { return category == ErrorCategory::BUILD || code == ErrorCode::PortInUse; }

  /**
   * @brief One line such as "[CRITICAL] registry/release port 7: ... (Release Without Holder)"
   */
  std::string summary() const;
};

inline const char* to_string(ErrorLevel level) { return level == ErrorLevel::CRITICAL ? "CRITICAL" : "ERROR"; }

inline const char* to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::LIFECYCLE:
      return "LIFECYCLE";
    case ErrorCategory::BUILD:
      return "BUILD";
    case ErrorCategory::SHUTDOWN:
      return "SHUTDOWN";
    case ErrorCategory::SOCKET:
      return "SOCKET";
    case ErrorCategory::CONFIGURATION:
      return "CONFIGURATION";
  }
  return "UNKNOWN";
}

inline std::string ErrorInfo::summary() const {
  std::string out = std::string("[") + to_string(level) + "] " + component + "/" + operation;
  if (port) {
    out += " port " + std::to_string(*port);
  }
  out += ": " + message;
  if (code != ErrorCode::Unknown) {
    out += " (" + to_string(code) + ")";
  }
  if (boost_error) {
    out += " [" + boost_error.message() + "]";
  }
  return out;
}

struct ErrorStats {
  size_t total = 0;
  size_t critical = 0;
  size_t by_category[kErrorCategoryCount] = {};

  size_t count(ErrorCategory category) const { return by_category[static_cast<size_t>(category)]; }
};

}  // namespace diagnostics
}  // namespace portshare
