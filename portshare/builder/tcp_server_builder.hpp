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
#include <memory>
#include <string>

#include "portshare/base/visibility.hpp"
#include "portshare/config/server_config.hpp"
#include "portshare/interface/iserver_builder.hpp"
#include "portshare/transport/tcp_server/tcp_test_server.hpp"

namespace portshare {
namespace builder {

/**
 * @brief Builds started TcpTestServer instances for the registry
 *
 * @code
 *   auto builder = std::make_shared<builder::TcpServerBuilder>();
 *   builder->bind_address("127.0.0.1").max_connections(8);
 *   auto server = registry->acquire(kAnyPort, *builder);
 * @endcode
 */
class PORTSHARE_API TcpServerBuilder : public interface::ServerBuilderInterface {
 public:
  TcpServerBuilder() = default;
  explicit TcpServerBuilder(const config::ServerConfig& cfg);

  /**
   * @brief Create and start a server on the port
   * @throws diagnostics::BuildException on invalid configuration or bind failure
   */
  std::shared_ptr<interface::ServerHandleInterface> build(uint16_t port) override;

  TcpServerBuilder& bind_address(const std::string& address);
  TcpServerBuilder& enable_port_retry(bool enable = true, int max_retries = 3, int retry_interval_ms = 1000);
  TcpServerBuilder& max_connections(size_t max);
  TcpServerBuilder& backlog(int backlog);
  TcpServerBuilder& start_timeout(int timeout_ms);

  // Reply produced for each received chunk; the default echoes
  TcpServerBuilder& on_data(transport::TcpTestServer::DataHandler handler);

  const config::ServerConfig& config() const { return cfg_; }

 private:
  config::ServerConfig cfg_;
  transport::TcpTestServer::DataHandler handler_;
};

}  // namespace builder
}  // namespace portshare
