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

#include "portshare/base/visibility.hpp"

namespace portshare {
namespace interface {

/**
 * @brief A running server shared through the registry
 *
 * The registry calls shutdown() exactly once, when the last holder of the
 * requested port releases it.
 */
class PORTSHARE_API ServerHandleInterface {
 public:
  virtual ~ServerHandleInterface() = default;

  /**
   * @brief Port the server is actually bound to
   *
   * Differs from the requested port only when kAnyPort was requested.
   */
  virtual uint16_t local_port() const = 0;

  virtual bool is_running() const = 0;

  /**
   * @brief Stop the server and release its OS resources
   */
  virtual void shutdown() = 0;
};

}  // namespace interface
}  // namespace portshare
