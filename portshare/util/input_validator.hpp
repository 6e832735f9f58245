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
#include <string>
#include <string_view>

#include "portshare/base/visibility.hpp"
#include "portshare/config/server_config.hpp"
#include "portshare/diagnostics/exceptions.hpp"

namespace portshare {
namespace util {

/**
 * @brief Input validation utility class
 *
 * Throws diagnostics::ValidationException for invalid inputs.
 */
class PORTSHARE_API InputValidator {
 public:
  // Network validation
  static void validate_bind_address(const std::string& address);
  static void validate_ipv4_address(const std::string& address);

  // Retry validation
  static void validate_retry_count(int retry_count);
  static void validate_retry_interval(int interval_ms);

  /**
   * @brief Validate every field of a server config
   */
  static void validate_server_config(const config::ServerConfig& cfg);

  // String validation
  static void validate_non_empty_string(const std::string& str, const std::string& field_name);

  // Numeric validation
  static void validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name);

 private:
  static bool is_valid_ipv4(std::string_view address);
  static bool is_valid_ipv6(const std::string& address);
};

inline void InputValidator::validate_non_empty_string(const std::string& str, const std::string& field_name) {
  if (str.empty()) {
    throw diagnostics::ValidationException(field_name + " cannot be empty", field_name, "non-empty string");
  }
}

inline void InputValidator::validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name) {
  if (value < min || value > max) {
    throw diagnostics::ValidationException(field_name + " out of range", field_name,
                                           std::to_string(min) + " <= value <= " + std::to_string(max));
  }
}

inline void InputValidator::validate_retry_count(int retry_count) {
  validate_range(retry_count, 0, config::constants::MAX_PORT_RETRIES, "max_port_retries");
}

inline void InputValidator::validate_retry_interval(int interval_ms) {
  validate_range(interval_ms, config::constants::MIN_PORT_RETRY_INTERVAL_MS,
                 config::constants::MAX_PORT_RETRY_INTERVAL_MS, "port_retry_interval_ms");
}

}  // namespace util
}  // namespace portshare
