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

#include <string>

#include "portshare/base/visibility.hpp"
#include "portshare/config/server_config.hpp"

namespace portshare {
namespace config {

/**
 * @brief Load a ServerConfig from a YAML file
 *
 * Recognized keys: bind_address, max_connections, backlog, enable_port_retry,
 * max_port_retries, port_retry_interval_ms, start_timeout_ms. Missing keys
 * keep their defaults; the result is validated before it is returned.
 *
 * @throws diagnostics::ConfigurationException if the file cannot be read or parsed
 * @throws diagnostics::ValidationException if a value is out of range
 */
PORTSHARE_API ServerConfig load_server_config(const std::string& path);

/**
 * @brief Same as load_server_config() for an in-memory YAML document
 */
PORTSHARE_API ServerConfig parse_server_config(const std::string& yaml_text);

}  // namespace config
}  // namespace portshare
