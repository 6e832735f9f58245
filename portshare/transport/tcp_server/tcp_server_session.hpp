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

#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "portshare/config/server_config.hpp"

namespace portshare {
namespace transport {

namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief One accepted client connection
 *
 * Every chunk read from the socket is handed to the data handler; a
 * non-empty return value is written back to the client.
 */
class TcpServerSession : public std::enable_shared_from_this<TcpServerSession> {
 public:
  using DataHandler = std::function<std::string(const std::string&)>;
  using OnClose = std::function<void()>;

  TcpServerSession(tcp::socket sock, DataHandler handler);

  void start();
  // Must run on the io_context thread
  void close();
  void on_close(OnClose cb);
  bool alive() const;

 private:
  void start_read();
  void do_write();

 private:
  tcp::socket socket_;
  DataHandler handler_;
  OnClose on_close_;

  std::array<char, config::constants::READ_BUFFER_SIZE> rx_{};
  std::deque<std::string> tx_;
  bool writing_ = false;
  std::atomic<bool> alive_{false};
};

}  // namespace transport
}  // namespace portshare
