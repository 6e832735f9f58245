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
#include <string>

namespace portshare {

/**
 * @brief Port value that asks the builder to let the OS pick a free port
 *
 * Requests for this port are still shared: every holder of kAnyPort gets the
 * same server until the last one releases it.
 */
constexpr uint16_t kAnyPort = 0;

/**
 * @brief Structured error codes for portshare
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,
  InternalError,

  // Server construction
  BuildFailed,
  PortInUse,
  AccessDenied,
  StartFailed,

  // Registry contract
  ReleaseWithoutHolder,
  NotAcquired,

  // Lifecycle
  Stopped,
  ShutdownFailed
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::InternalError:
      return "Internal Error";
    case ErrorCode::BuildFailed:
      return "Server Build Failed";
    case ErrorCode::PortInUse:
      return "Port Already In Use";
    case ErrorCode::AccessDenied:
      return "Access Denied";
    case ErrorCode::StartFailed:
      return "Failed to Start";
    case ErrorCode::ReleaseWithoutHolder:
      return "Release Without Holder";
    case ErrorCode::NotAcquired:
      return "Server Not Acquired";
    case ErrorCode::Stopped:
      return "Stopped";
    case ErrorCode::ShutdownFailed:
      return "Shutdown Failed";
  }
  return "Unknown Error Code";
}

}  // namespace portshare
