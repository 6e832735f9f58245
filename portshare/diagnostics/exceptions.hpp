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
#include <stdexcept>
#include <string>

#include "portshare/base/error_codes.hpp"
#include "portshare/base/visibility.hpp"

namespace portshare {
namespace diagnostics {

/**
 * @brief Base exception class for all portshare exceptions
 *
 * Carries the component and operation that raised it, plus a structured
 * ErrorCode, so callers can tell build failures from contract violations.
 */
class PORTSHARE_API PortshareException : public std::runtime_error {
 public:
  explicit PortshareException(const std::string& message, const std::string& component = "",
                              const std::string& operation = "", ErrorCode code = ErrorCode::Unknown)
      : std::runtime_error(message), component_(component), operation_(operation), code_(code) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }
  ErrorCode get_code() const noexcept { return code_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
  ErrorCode code_;
};

/**
 * @brief Thrown when a builder could not produce a running server
 *
 * The registry leaves the requested port unregistered when this is thrown,
 * so acquiring the same port again retries the build.
 */
class PORTSHARE_API BuildException : public PortshareException {
 public:
  explicit BuildException(const std::string& message, uint16_t port = 0, const std::string& component = "builder",
                          ErrorCode code = ErrorCode::BuildFailed)
      : PortshareException(message, component, "build", code), port_(port) {}

  uint16_t get_port() const noexcept { return port_; }

  std::string get_full_message() const {
    return PortshareException::get_full_message() + " (port: " + std::to_string(port_) + ")";
  }

 private:
  uint16_t port_;
};

/**
 * @brief Thrown by release() for a port that has no outstanding holder
 *
 * Signals unbalanced acquire/release in the caller. Registry state is left
 * untouched.
 */
class PORTSHARE_API ReleaseWithoutHolderException : public PortshareException {
 public:
  explicit ReleaseWithoutHolderException(uint16_t port)
      : PortshareException("release of port " + std::to_string(port) + " without a matching acquire", "registry",
                           "release", ErrorCode::ReleaseWithoutHolder),
        port_(port) {}

  uint16_t get_port() const noexcept { return port_; }

 private:
  uint16_t port_;
};

/**
 * @brief Thrown when an object is used in a state that does not allow it
 */
class PORTSHARE_API StateException : public PortshareException {
 public:
  explicit StateException(const std::string& message, const std::string& component = "",
                          const std::string& operation = "", ErrorCode code = ErrorCode::NotAcquired)
      : PortshareException(message, component, operation, code) {}
};

/**
 * @brief Exception thrown during input validation
 */
class PORTSHARE_API ValidationException : public PortshareException {
 public:
  explicit ValidationException(const std::string& message, const std::string& parameter = "",
                               const std::string& expected = "")
      : PortshareException(message, "validation", "validate", ErrorCode::InvalidConfiguration),
        parameter_(parameter),
        expected_(expected) {}

  const std::string& get_parameter() const noexcept { return parameter_; }
  const std::string& get_expected() const noexcept { return expected_; }

  std::string get_full_message() const {
    std::string full_msg = PortshareException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    if (!expected_.empty()) {
      full_msg += " (expected: " + expected_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
  std::string expected_;
};

/**
 * @brief Exception thrown while loading or applying configuration
 */
class PORTSHARE_API ConfigurationException : public PortshareException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_section = "",
                                  const std::string& operation = "")
      : PortshareException(message, "configuration", operation, ErrorCode::InvalidConfiguration),
        config_section_(config_section) {}

  const std::string& get_config_section() const noexcept { return config_section_; }

  std::string get_full_message() const {
    std::string full_msg = PortshareException::get_full_message();
    if (!config_section_.empty()) {
      full_msg += " (section: " + config_section_ + ")";
    }
    return full_msg;
  }

 private:
  std::string config_section_;
};

}  // namespace diagnostics
}  // namespace portshare
