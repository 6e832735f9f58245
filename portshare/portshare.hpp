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

// Convenience header pulling in the whole public API

#include "portshare/base/error_codes.hpp"
#include "portshare/builder/tcp_server_builder.hpp"
#include "portshare/config/config_loader.hpp"
#include "portshare/config/server_config.hpp"
#include "portshare/diagnostics/error_handler.hpp"
#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"
#include "portshare/interface/iserver_builder.hpp"
#include "portshare/interface/iserver_handle.hpp"
#include "portshare/registry/server_lease.hpp"
#include "portshare/registry/shared_server_registry.hpp"
#include "portshare/transport/tcp_server/tcp_test_server.hpp"
