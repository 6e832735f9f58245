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

#include "portshare/transport/tcp_server/tcp_server_session.hpp"

#include "portshare/diagnostics/logger.hpp"

namespace portshare {
namespace transport {

TcpServerSession::TcpServerSession(tcp::socket sock, DataHandler handler)
    : socket_(std::move(sock)), handler_(std::move(handler)) {}

void TcpServerSession::start() {
  alive_.store(true);
  start_read();
}

void TcpServerSession::on_close(OnClose cb) { on_close_ = std::move(cb); }

bool TcpServerSession::alive() const { return alive_.load(); }

void TcpServerSession::start_read() {
  auto self = shared_from_this();
  socket_.async_read_some(net::buffer(rx_.data(), rx_.size()), [self](auto ec, std::size_t n) {
    if (ec) {
      self->close();
      return;
    }
    if (self->handler_) {
      std::string reply;
      try {
        reply = self->handler_(std::string(self->rx_.data(), n));
      } catch (const std::exception& e) {
        PORTSHARE_LOG_ERROR("tcp_session", "on_data", "Exception in data handler: " + std::string(e.what()));
        self->close();
        return;
      }
      if (!reply.empty()) {
        self->tx_.emplace_back(std::move(reply));
        if (!self->writing_) self->do_write();
      }
    }
    self->start_read();
  });
}

void TcpServerSession::do_write() {
  if (tx_.empty()) {
    writing_ = false;
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  net::async_write(socket_, net::buffer(tx_.front()), [self](auto ec, std::size_t) {
    if (ec) {
      self->close();
      return;
    }
    self->tx_.pop_front();
    self->do_write();
  });
}

void TcpServerSession::close() {
  if (!alive_.exchange(false)) return;
  PORTSHARE_LOG_DEBUG("tcp_session", "disconnect", "Client disconnected");
  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (on_close_) {
    try {
      on_close_();
    } catch (const std::exception& e) {
      PORTSHARE_LOG_ERROR("tcp_session", "on_close", "Exception in on_close callback: " + std::string(e.what()));
    }
  }
}

}  // namespace transport
}  // namespace portshare
