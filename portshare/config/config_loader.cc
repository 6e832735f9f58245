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

#include "portshare/config/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include "portshare/diagnostics/error_handler.hpp"
#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"
#include "portshare/util/input_validator.hpp"

namespace portshare {
namespace config {

namespace {

template <typename T>
T get_or(const YAML::Node& n, const char* key, const T& defv) {
  if (n[key]) return n[key].as<T>();
  return defv;
}

ServerConfig from_node(const YAML::Node& root, const std::string& source) {
  if (!root.IsMap()) {
    diagnostics::error_reporting::report_configuration_error("load", source + " is not a YAML mapping");
    throw diagnostics::ConfigurationException(source + " is not a YAML mapping", "root", "load");
  }

  const YAML::Node server = root["server"] ? root["server"] : root;

  ServerConfig c;
  try {
    c.bind_address = get_or(server, "bind_address", c.bind_address);
    c.max_connections = get_or(server, "max_connections", c.max_connections);
    c.backlog = get_or(server, "backlog", c.backlog);
    c.enable_port_retry = get_or(server, "enable_port_retry", c.enable_port_retry);
    c.max_port_retries = get_or(server, "max_port_retries", c.max_port_retries);
    c.port_retry_interval_ms = get_or(server, "port_retry_interval_ms", c.port_retry_interval_ms);
    c.start_timeout_ms = get_or(server, "start_timeout_ms", c.start_timeout_ms);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("load", e.what());
    throw diagnostics::ConfigurationException("invalid value in " + source + ": " + e.what(), "server", "load");
  }

  util::InputValidator::validate_server_config(c);
  PORTSHARE_LOG_DEBUG("config", "load", "Loaded server config from " + source);
  return c;
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("load", e.what());
    throw diagnostics::ConfigurationException("failed to read " + path + ": " + e.what(), "", "load");
  }
  return from_node(root, path);
}

ServerConfig parse_server_config(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("parse", e.what());
    throw diagnostics::ConfigurationException(std::string("failed to parse YAML: ") + e.what(), "", "parse");
  }
  return from_node(root, "<inline>");
}

}  // namespace config
}  // namespace portshare
