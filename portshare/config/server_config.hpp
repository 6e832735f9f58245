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

#include <cstddef>
#include <cstdint>
#include <string>

namespace portshare {
namespace config {

namespace constants {
constexpr size_t DEFAULT_MAX_CONNECTIONS = 64;
constexpr size_t MAX_MAX_CONNECTIONS = 4096;
constexpr int DEFAULT_BACKLOG = 128;
constexpr int MIN_BACKLOG = 1;
constexpr int MAX_BACKLOG = 4096;
constexpr int DEFAULT_MAX_PORT_RETRIES = 3;
constexpr int MAX_PORT_RETRIES = 100;
constexpr int DEFAULT_PORT_RETRY_INTERVAL_MS = 1000;
constexpr int MIN_PORT_RETRY_INTERVAL_MS = 1;
constexpr int MAX_PORT_RETRY_INTERVAL_MS = 60000;
constexpr int DEFAULT_START_TIMEOUT_MS = 5000;
constexpr size_t READ_BUFFER_SIZE = 4096;
}  // namespace constants

/**
 * @brief How a shared test server is built
 *
 * The port itself is not part of the config: the registry passes the
 * requested port to the builder on every build.
 */
struct ServerConfig {
  std::string bind_address = "127.0.0.1";
  size_t max_connections = constants::DEFAULT_MAX_CONNECTIONS;
  int backlog = constants::DEFAULT_BACKLOG;

  // Port binding retry configuration
  bool enable_port_retry = false;
  int max_port_retries = constants::DEFAULT_MAX_PORT_RETRIES;
  int port_retry_interval_ms = constants::DEFAULT_PORT_RETRY_INTERVAL_MS;

  // Upper bound on how long build() waits for bind/listen to finish
  int start_timeout_ms = constants::DEFAULT_START_TIMEOUT_MS;

  bool is_valid() const {
    return !bind_address.empty() && max_connections > 0 && max_connections <= constants::MAX_MAX_CONNECTIONS &&
           backlog >= constants::MIN_BACKLOG && backlog <= constants::MAX_BACKLOG && max_port_retries >= 0 &&
           max_port_retries <= constants::MAX_PORT_RETRIES &&
           port_retry_interval_ms >= constants::MIN_PORT_RETRY_INTERVAL_MS &&
           port_retry_interval_ms <= constants::MAX_PORT_RETRY_INTERVAL_MS && start_timeout_ms > 0;
  }

  // Apply validation and clamp values to valid ranges
  void validate_and_clamp() {
    if (max_connections == 0) {
      max_connections = 1;
    } else if (max_connections > constants::MAX_MAX_CONNECTIONS) {
      max_connections = constants::MAX_MAX_CONNECTIONS;
    }

    if (backlog < constants::MIN_BACKLOG) {
      backlog = constants::MIN_BACKLOG;
    } else if (backlog > constants::MAX_BACKLOG) {
      backlog = constants::MAX_BACKLOG;
    }

    if (max_port_retries < 0) {
      max_port_retries = 0;
    } else if (max_port_retries > constants::MAX_PORT_RETRIES) {
      max_port_retries = constants::MAX_PORT_RETRIES;
    }

    if (port_retry_interval_ms < constants::MIN_PORT_RETRY_INTERVAL_MS) {
      port_retry_interval_ms = constants::MIN_PORT_RETRY_INTERVAL_MS;
    } else if (port_retry_interval_ms > constants::MAX_PORT_RETRY_INTERVAL_MS) {
      port_retry_interval_ms = constants::MAX_PORT_RETRY_INTERVAL_MS;
    }

    if (start_timeout_ms <= 0) {
      start_timeout_ms = constants::DEFAULT_START_TIMEOUT_MS;
    }
  }
};

}  // namespace config
}  // namespace portshare
