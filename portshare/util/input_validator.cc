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

#include "portshare/util/input_validator.hpp"

#include <boost/asio/ip/address_v6.hpp>
#include <charconv>

namespace portshare {
namespace util {

void InputValidator::validate_bind_address(const std::string& address) {
  validate_non_empty_string(address, "bind_address");

  if (is_valid_ipv4(address) || is_valid_ipv6(address)) {
    return;
  }

  throw diagnostics::ValidationException("invalid bind address format", "bind_address",
                                         "valid IPv4 or IPv6 address");
}

void InputValidator::validate_ipv4_address(const std::string& address) {
  validate_non_empty_string(address, "ipv4_address");

  if (!is_valid_ipv4(address)) {
    throw diagnostics::ValidationException("invalid IPv4 address format", "ipv4_address", "valid IPv4 address");
  }
}

void InputValidator::validate_server_config(const config::ServerConfig& cfg) {
  validate_bind_address(cfg.bind_address);
  validate_range(static_cast<int64_t>(cfg.max_connections), 1,
                 static_cast<int64_t>(config::constants::MAX_MAX_CONNECTIONS), "max_connections");
  validate_range(cfg.backlog, config::constants::MIN_BACKLOG, config::constants::MAX_BACKLOG, "backlog");
  validate_retry_count(cfg.max_port_retries);
  validate_retry_interval(cfg.port_retry_interval_ms);
  if (cfg.start_timeout_ms <= 0) {
    throw diagnostics::ValidationException("start_timeout_ms must be positive", "start_timeout_ms",
                                           "positive number");
  }
}

bool InputValidator::is_valid_ipv4(std::string_view address) {
  if (address.empty()) return false;

  int dots = 0;
  size_t start = 0;
  size_t end = 0;

  while ((end = address.find('.', start)) != std::string_view::npos) {
    if (end == start) return false;  // Empty octet
    size_t len = end - start;
    if (len > 3) return false;

    // Leading zero is only allowed for "0" itself
    if (len > 1 && address[start] == '0') return false;

    int octet;
    auto res = std::from_chars(address.data() + start, address.data() + end, octet);
    if (res.ec != std::errc() || res.ptr != address.data() + end) return false;
    if (octet < 0 || octet > 255) return false;

    dots++;
    start = end + 1;
  }

  // Last octet
  if (start >= address.length()) return false;
  size_t len = address.length() - start;
  if (len > 3) return false;
  if (len > 1 && address[start] == '0') return false;

  int octet;
  auto res = std::from_chars(address.data() + start, address.data() + address.length(), octet);
  if (res.ec != std::errc() || res.ptr != address.data() + address.length()) return false;
  if (octet < 0 || octet > 255) return false;

  return dots == 3;
}

bool InputValidator::is_valid_ipv6(const std::string& address) {
  if (address.find(':') == std::string::npos) return false;

  boost::system::error_code ec;
  boost::asio::ip::make_address_v6(address, ec);
  return !ec;
}

}  // namespace util
}  // namespace portshare
