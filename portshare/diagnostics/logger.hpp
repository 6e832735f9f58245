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

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "portshare/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif

namespace portshare {
namespace diagnostics {

enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Thread-safe logger shared by the registry, leases and servers
 *
 * Lines read "{timestamp} [{level}] [{component}] [{operation}] {message}".
 * They go to the console unless a sink is installed; a test can install a
 * sink to capture what a registry or server reported.
 */
class PORTSHARE_API Logger {
 public:
  using Sink = std::function<void(LogLevel level, const std::string& line)>;

  static Logger& instance();

  Logger();
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level);
  LogLevel get_level() const;
  bool should_log(LogLevel level) const { return level >= get_level(); }

  /**
   * @brief Route lines to sink instead of the console; nullptr restores the console
   */
  void set_sink(Sink sink);

  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

  static std::string_view level_to_string(LogLevel level);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace diagnostics
}  // namespace portshare

// The message expression is only evaluated when the level is enabled
#define PORTSHARE_LOG_AT(level_value, method, component, operation, message) \
  do {                                                                       \
    auto& _portshare_logger = portshare::diagnostics::Logger::instance();   \
    if (_portshare_logger.should_log(level_value)) {                         \
      _portshare_logger.method(component, operation, message);               \
    }                                                                        \
  } while (0)

#define PORTSHARE_LOG_DEBUG(component, operation, message) \
  PORTSHARE_LOG_AT(portshare::diagnostics::LogLevel::DEBUG, debug, component, operation, message)

#define PORTSHARE_LOG_INFO(component, operation, message) \
  PORTSHARE_LOG_AT(portshare::diagnostics::LogLevel::INFO, info, component, operation, message)

#define PORTSHARE_LOG_WARNING(component, operation, message) \
  PORTSHARE_LOG_AT(portshare::diagnostics::LogLevel::WARNING, warning, component, operation, message)

#define PORTSHARE_LOG_ERROR(component, operation, message) \
  PORTSHARE_LOG_AT(portshare::diagnostics::LogLevel::ERROR, error, component, operation, message)

#define PORTSHARE_LOG_CRITICAL(component, operation, message) \
  PORTSHARE_LOG_AT(portshare::diagnostics::LogLevel::CRITICAL, critical, component, operation, message)
