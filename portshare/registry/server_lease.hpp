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

#include "portshare/base/visibility.hpp"
#include "portshare/interface/iserver_builder.hpp"
#include "portshare/registry/shared_server_registry.hpp"

namespace portshare {
namespace registry {

/**
 * @brief One holder's claim on a shared server
 *
 * open() acquires the server for the port, close() releases it once. The
 * destructor closes the lease, so a test fixture can simply own one:
 *
 * @code
 *   class MyTest : public ::testing::Test {
 *    protected:
 *     void SetUp() override { lease_.open(); }
 *     registry::ServerLease lease_{registry_, 0, builder_};
 *   };
 * @endcode
 */
class PORTSHARE_API ServerLease {
 public:
  ServerLease(std::shared_ptr<SharedServerRegistry> registry, uint16_t port,
              std::shared_ptr<interface::ServerBuilderInterface> builder);
  ~ServerLease();

  ServerLease(const ServerLease&) = delete;
  ServerLease& operator=(const ServerLease&) = delete;
  ServerLease(ServerLease&& other) noexcept;
  ServerLease& operator=(ServerLease&& other) noexcept;

  /**
   * @brief Acquire the server; does nothing if the lease is already open
   * @throws diagnostics::BuildException if the server could not be started
   */
  void open();

  /**
   * @brief Release the server if this lease holds it
   */
  void close();

  bool is_open() const { return server_ != nullptr; }

  /**
   * @brief The shared server
   * @throws diagnostics::StateException if the lease is not open
   */
  std::shared_ptr<interface::ServerHandleInterface> server() const;

  uint16_t requested_port() const { return port_; }

  /**
   * @throws diagnostics::StateException if the lease is not open
   */
  uint16_t local_port() const;

 private:
  std::shared_ptr<SharedServerRegistry> registry_;
  uint16_t port_;
  std::shared_ptr<interface::ServerBuilderInterface> builder_;
  std::shared_ptr<interface::ServerHandleInterface> server_;
};

}  // namespace registry
}  // namespace portshare
