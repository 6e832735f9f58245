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

#include "portshare/registry/server_lease.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"

namespace portshare {
namespace registry {

ServerLease::ServerLease(std::shared_ptr<SharedServerRegistry> registry, uint16_t port,
                         std::shared_ptr<interface::ServerBuilderInterface> builder)
    : registry_(std::move(registry)), port_(port), builder_(std::move(builder)) {
  if (!registry_) {
    throw std::invalid_argument("ServerLease requires a registry");
  }
  if (!builder_) {
    throw std::invalid_argument("ServerLease requires a builder");
  }
}

ServerLease::~ServerLease() {
  try {
    close();
  } catch (const std::exception& e) {
    PORTSHARE_LOG_ERROR("lease", "close", "Failed to release port " + std::to_string(port_) + ": " + e.what());
  }
}

ServerLease::ServerLease(ServerLease&& other) noexcept
    : registry_(std::move(other.registry_)),
      port_(other.port_),
      builder_(std::move(other.builder_)),
      server_(std::move(other.server_)) {
  other.server_.reset();
}

ServerLease& ServerLease::operator=(ServerLease&& other) noexcept {
  if (this != &other) {
    try {
      close();
    } catch (const std::exception& e) {
      PORTSHARE_LOG_ERROR("lease", "close", "Failed to release port " + std::to_string(port_) + ": " + e.what());
    }
    registry_ = std::move(other.registry_);
    port_ = other.port_;
    builder_ = std::move(other.builder_);
    server_ = std::move(other.server_);
    other.server_.reset();
  }
  return *this;
}

void ServerLease::open() {
  if (server_) {
    return;
  }
  if (!registry_) {
    throw diagnostics::StateException("lease for port " + std::to_string(port_) + " was moved from", "lease", "open");
  }
  server_ = registry_->acquire(port_, *builder_);
}

void ServerLease::close() {
  if (!registry_) {
    return;
  }
  if (!server_) {
    PORTSHARE_LOG_DEBUG("lease", "close",
                        "Cannot close server for port " + std::to_string(port_) +
                            ". It is likely that it had trouble starting.");
    return;
  }

  PORTSHARE_LOG_DEBUG("lease", "close", "Closing server at port " + std::to_string(server_->local_port()));
  server_.reset();
  registry_->release(port_);
}

std::shared_ptr<interface::ServerHandleInterface> ServerLease::server() const {
  if (!server_) {
    throw diagnostics::StateException("lease for port " + std::to_string(port_) + " is not open", "lease", "server");
  }
  return server_;
}

uint16_t ServerLease::local_port() const { return server()->local_port(); }

}  // namespace registry
}  // namespace portshare
