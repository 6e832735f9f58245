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

#include "portshare/builder/tcp_server_builder.hpp"

#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"
#include "portshare/util/input_validator.hpp"

namespace portshare {
namespace builder {

TcpServerBuilder::TcpServerBuilder(const config::ServerConfig& cfg) : cfg_(cfg) {}

std::shared_ptr<interface::ServerHandleInterface> TcpServerBuilder::build(uint16_t port) {
  try {
    util::InputValidator::validate_server_config(cfg_);
  } catch (const diagnostics::ValidationException& e) {
    PORTSHARE_LOG_ERROR("builder", "build", e.get_full_message());
    throw diagnostics::BuildException(e.what(), port, "builder", ErrorCode::InvalidConfiguration);
  }

  auto server = std::make_shared<transport::TcpTestServer>(cfg_, port, handler_);
  server->start();
  return server;
}

TcpServerBuilder& TcpServerBuilder::bind_address(const std::string& address) {
  cfg_.bind_address = address;
  return *this;
}

TcpServerBuilder& TcpServerBuilder::enable_port_retry(bool enable, int max_retries, int retry_interval_ms) {
  cfg_.enable_port_retry = enable;
  cfg_.max_port_retries = max_retries;
  cfg_.port_retry_interval_ms = retry_interval_ms;
  return *this;
}

TcpServerBuilder& TcpServerBuilder::max_connections(size_t max) {
  cfg_.max_connections = max;
  return *this;
}

TcpServerBuilder& TcpServerBuilder::backlog(int backlog) {
  cfg_.backlog = backlog;
  return *this;
}

TcpServerBuilder& TcpServerBuilder::start_timeout(int timeout_ms) {
  cfg_.start_timeout_ms = timeout_ms;
  return *this;
}

TcpServerBuilder& TcpServerBuilder::on_data(transport::TcpTestServer::DataHandler handler) {
  handler_ = std::move(handler);
  return *this;
}

}  // namespace builder
}  // namespace portshare
