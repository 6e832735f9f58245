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

#include "portshare/registry/shared_server_registry.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "portshare/diagnostics/error_handler.hpp"
#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"

namespace portshare {
namespace registry {

namespace {

// Logs and reports a failed build, then throws it as a BuildException.
// A null failure means the builder returned no server.
void raise_build_failure(uint16_t port, const std::exception_ptr& failure) {
  if (!failure) {
    PORTSHARE_LOG_ERROR("registry", "acquire", "Builder returned no server for port " + std::to_string(port));
    diagnostics::error_reporting::report_build_failure("registry", port, "builder returned no server");
    throw diagnostics::BuildException("builder returned no server", port, "registry");
  }

  try {
    std::rethrow_exception(failure);
  } catch (const diagnostics::BuildException& e) {
    PORTSHARE_LOG_ERROR("registry", "acquire", e.get_full_message());
    diagnostics::error_reporting::report_build_failure("registry", port, e.what(), e.get_code());
    throw;
  } catch (const std::exception& e) {
    PORTSHARE_LOG_ERROR("registry", "acquire",
                        "Failed to start server at port " + std::to_string(port) + ": " + e.what());
    diagnostics::error_reporting::report_build_failure("registry", port, e.what());
    throw diagnostics::BuildException(e.what(), port, "registry");
  }
}

}  // namespace

std::shared_ptr<SharedServerRegistry> SharedServerRegistry::create() {
  return std::make_shared<SharedServerRegistry>();
}

SharedServerRegistry::~SharedServerRegistry() {
  std::unordered_map<uint16_t, Entry> leaked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    leaked.swap(entries_);
  }

  for (auto& item : leaked) {
    PORTSHARE_LOG_WARNING("registry", "destroy",
                          "Server at port " + std::to_string(item.first) + " still has " +
                              std::to_string(item.second.ref_count) + " holder(s), shutting it down");
    try {
      item.second.server->shutdown();
    } catch (const std::exception& e) {
      PORTSHARE_LOG_ERROR("registry", "destroy",
                          "Failed to shut down server at port " + std::to_string(item.first) + ": " + e.what());
    }
  }
}

SharedServerRegistry::ServerHandle SharedServerRegistry::acquire(uint16_t port,
                                                                 interface::ServerBuilderInterface& builder) {
  ServerHandle server;
  size_t holders = 0;
  bool built = false;
  std::exception_ptr failure;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(port);
    if (it == entries_.end()) {
      try {
        server = builder.build(port);
      } catch (const std::exception&) {
        failure = std::current_exception();
      }
      // Nothing is stored unless the build succeeded, so a failed build leaves the port absent
      if (server) {
        it = entries_.emplace(port, Entry{server, 0}).first;
        built = true;
      }
    } else {
      server = it->second.server;
    }

    if (server) {
      holders = ++it->second.ref_count;
    }
  }

  if (!server) {
    raise_build_failure(port, failure);
  }

  if (!built) {
    PORTSHARE_LOG_DEBUG("registry", "acquire",
                        "Using existing server at port " + std::to_string(port) + " (" + std::to_string(holders) +
                            " holders)");
  } else if (port == kAnyPort) {
    PORTSHARE_LOG_DEBUG("registry", "acquire",
                        "Server bound to 0 actually started at port " + std::to_string(server->local_port()));
  } else {
    PORTSHARE_LOG_DEBUG("registry", "acquire", "Started new server at port " + std::to_string(server->local_port()));
  }
  return server;
}

void SharedServerRegistry::release(uint16_t port) {
  ServerHandle closed;
  bool held = false;
  size_t remaining = 0;
  std::exception_ptr failure;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(port);
    if (it != entries_.end()) {
      held = true;
      remaining = --it->second.ref_count;
      if (remaining == 0) {
        closed = std::move(it->second.server);
        entries_.erase(it);
        // Still under the lock, so a rebuild of this port cannot race the closing socket
        try {
          closed->shutdown();
        } catch (const std::exception&) {
          failure = std::current_exception();
        }
      }
    }
  }

  if (!held) {
    PORTSHARE_LOG_CRITICAL("registry", "release",
                           "Release of port " + std::to_string(port) + " without a matching acquire");
    diagnostics::error_reporting::report_release_without_holder(port);
    throw diagnostics::ReleaseWithoutHolderException(port);
  }

  if (remaining > 0) {
    PORTSHARE_LOG_DEBUG("registry", "release",
                        "Server at port " + std::to_string(port) + " still has " + std::to_string(remaining) +
                            " holder(s)");
    return;
  }

  if (failure) {
    try {
      std::rethrow_exception(failure);
    } catch (const std::exception& e) {
      PORTSHARE_LOG_ERROR("registry", "release",
                          "Server at port " + std::to_string(port) + " failed to shut down: " + e.what());
      diagnostics::error_reporting::report_shutdown_failure(port, e.what());
      throw;
    }
  }

  PORTSHARE_LOG_DEBUG("registry", "release",
                      "Closed server at port " + std::to_string(closed->local_port()) + " (requested " +
                          std::to_string(port) + ")");
}

size_t SharedServerRegistry::ref_count(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(port);
  return it == entries_.end() ? 0 : it->second.ref_count;
}

bool SharedServerRegistry::is_registered(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.find(port) != entries_.end();
}

SharedServerRegistry::ServerHandle SharedServerRegistry::find(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(port);
  return it == entries_.end() ? nullptr : it->second.server;
}

size_t SharedServerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<uint16_t> SharedServerRegistry::registered_ports() const {
  std::vector<uint16_t> ports;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ports.reserve(entries_.size());
    for (const auto& item : entries_) {
      ports.push_back(item.first);
    }
  }
  std::sort(ports.begin(), ports.end());
  return ports;
}

}  // namespace registry
}  // namespace portshare
