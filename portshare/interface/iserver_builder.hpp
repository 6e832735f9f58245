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
#include "portshare/interface/iserver_handle.hpp"

namespace portshare {
namespace interface {

/**
 * @brief Creates running servers on demand for the registry
 */
class PORTSHARE_API ServerBuilderInterface {
 public:
  virtual ~ServerBuilderInterface() = default;

  /**
   * @brief Start a server on the given port
   * @param port Requested port, kAnyPort lets the OS choose
   * @return Running server, never null on success
   * @throws diagnostics::BuildException (or any std::exception) if the server could not be started
   */
  virtual std::shared_ptr<ServerHandleInterface> build(uint16_t port) = 0;
};

}  // namespace interface
}  // namespace portshare
