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
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "portshare/base/error_codes.hpp"
#include "portshare/base/visibility.hpp"
#include "portshare/interface/iserver_builder.hpp"
#include "portshare/interface/iserver_handle.hpp"

namespace portshare {
namespace registry {

/**
 * @brief Reference-counted registry of shared servers keyed by requested port
 *
 * The first acquire() of a port builds a server, later acquires of the same
 * port get the same server, and the release() that drops the count to zero
 * shuts it down. Entries are keyed by the *requested* port: every caller that
 * asks for kAnyPort shares one server, whatever port the OS gave it.
 *
 * All acquire/release calls are serialized by one mutex, which is also held
 * while the builder runs and while a server shuts down. The registry's own
 * log lines and error reports are emitted after the mutex is released, so an
 * ErrorHandler callback or log sink may query the registry. Builders and
 * servers must not call back into the registry.
 *
 * WARNING: callers sharing a port also share the server that the first
 * caller's builder created; a different builder passed by a later caller for
 * the same port is ignored.
 */
class PORTSHARE_API SharedServerRegistry {
 public:
  using ServerHandle = std::shared_ptr<interface::ServerHandleInterface>;

  static std::shared_ptr<SharedServerRegistry> create();

  SharedServerRegistry() = default;
  ~SharedServerRegistry();

  SharedServerRegistry(const SharedServerRegistry&) = delete;
  SharedServerRegistry& operator=(const SharedServerRegistry&) = delete;

  /**
   * @brief Get the server for a port, building it if nobody holds it
   * @param port Requested port, kAnyPort lets the builder choose
   * @param builder Used only when no server is registered for port
   * @return The registered server
   * @throws diagnostics::BuildException if the builder fails; the port stays unregistered
   */
  ServerHandle acquire(uint16_t port, interface::ServerBuilderInterface& builder);

  /**
   * @brief Drop one hold on a port, shutting its server down on the last one
   * @throws diagnostics::ReleaseWithoutHolderException if the port has no holder
   */
  void release(uint16_t port);

  size_t ref_count(uint16_t port) const;
  bool is_registered(uint16_t port) const;

  /**
   * @brief Registered server for a port, or nullptr
   */
  ServerHandle find(uint16_t port) const;

  size_t size() const;
  std::vector<uint16_t> registered_ports() const;

 private:
  struct Entry {
    ServerHandle server;
    size_t ref_count;
  };

  mutable std::mutex mutex_;
  std::unordered_map<uint16_t, Entry> entries_;
};

}  // namespace registry
}  // namespace portshare
