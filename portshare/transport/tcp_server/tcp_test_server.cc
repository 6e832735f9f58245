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

#include "portshare/transport/tcp_server/tcp_test_server.hpp"

#include <algorithm>
#include <chrono>
#include <string>

#include "portshare/diagnostics/error_handler.hpp"
#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"
#include "portshare/transport/tcp_server/boost_tcp_acceptor.hpp"

namespace portshare {
namespace transport {

using tcp = net::ip::tcp;

namespace {

ErrorCode bind_error_code(const boost::system::error_code& ec) {
  if (ec == net::error::address_in_use) return ErrorCode::PortInUse;
  if (ec == net::error::access_denied) return ErrorCode::AccessDenied;
  return ErrorCode::StartFailed;
}

}  // namespace

TcpTestServer::TcpTestServer(const config::ServerConfig& cfg, uint16_t port, DataHandler handler)
    : TcpTestServer(cfg, port, std::move(handler),
                    [](net::io_context& ioc) { return std::make_unique<BoostTcpAcceptor>(ioc); }) {}

TcpTestServer::TcpTestServer(const config::ServerConfig& cfg, uint16_t port, DataHandler handler,
                             AcceptorFactory acceptor_factory)
    : cfg_(cfg), requested_port_(port), handler_(std::move(handler)) {
  if (!handler_) {
    handler_ = [](const std::string& data) { return data; };
  }
  if (acceptor_factory) {
    acceptor_ = acceptor_factory(ioc_);
  }
  if (!acceptor_) {
    throw diagnostics::BuildException("Failed to create TCP acceptor", port, "tcp_server");
  }
}

TcpTestServer::~TcpTestServer() {
  try {
    shutdown();
  } catch (const std::exception& e) {
    PORTSHARE_LOG_ERROR("tcp_server", "destroy", "Shutdown failed: " + std::string(e.what()));
  }
}

void TcpTestServer::start() {
  State current = state_.load();
  if (current == State::Listening) {
    PORTSHARE_LOG_DEBUG("tcp_server", "start", "Start called while already listening, ignoring");
    return;
  }
  if (current != State::Idle) {
    throw diagnostics::StateException("server for port " + std::to_string(requested_port_) + " cannot be restarted",
                                      "tcp_server", "start", ErrorCode::Stopped);
  }

  work_guard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc_));
  ioc_thread_ = std::thread([this] { ioc_.run(); });

  auto bound = std::make_shared<std::promise<boost::system::error_code>>();
  auto bound_future = bound->get_future();
  auto self = shared_from_this();
  net::post(ioc_, [self, bound] { self->attempt_port_binding(0, bound); });

  auto timeout = std::chrono::milliseconds(cfg_.start_timeout_ms);
  if (cfg_.enable_port_retry) {
    timeout += std::chrono::milliseconds(cfg_.port_retry_interval_ms) * cfg_.max_port_retries;
  }

  if (bound_future.wait_for(timeout) != std::future_status::ready) {
    stop_io();
    state_.store(State::Error);
    std::string msg = "Timed out binding port " + std::to_string(requested_port_);
    PORTSHARE_LOG_ERROR("tcp_server", "start", msg);
    throw diagnostics::BuildException(msg, requested_port_, "tcp_server", ErrorCode::StartFailed);
  }

  boost::system::error_code ec = bound_future.get();
  if (ec) {
    stop_io();
    state_.store(State::Error);
    throw diagnostics::BuildException("Failed to bind port " + std::to_string(requested_port_) + ": " + ec.message(),
                                      requested_port_, "tcp_server", bind_error_code(ec));
  }
}

uint16_t TcpTestServer::local_port() const { return local_port_.load(); }

bool TcpTestServer::is_running() const { return state_.load() == State::Listening; }

void TcpTestServer::shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  PORTSHARE_LOG_DEBUG("tcp_server", "shutdown", "Stopping server at port " + std::to_string(local_port_.load()));
  stop_io();
  state_.store(State::Closed);
}

size_t TcpTestServer::connection_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

void TcpTestServer::attempt_port_binding(int retry_count, BindPromise bound) {
  if (stopping_.load()) {
    bound->set_value(net::error::operation_aborted);
    return;
  }
  boost::system::error_code ec;

  auto address = net::ip::make_address(cfg_.bind_address, ec);
  if (ec) {
    PORTSHARE_LOG_ERROR("tcp_server", "bind", "Invalid bind address '" + cfg_.bind_address + "': " + ec.message());
    diagnostics::error_reporting::report_socket_error(requested_port_, "bind", ec);
    bound->set_value(ec);
    return;
  }
  tcp::endpoint endpoint(address, requested_port_);

  if (!acceptor_->is_open()) {
    acceptor_->open(endpoint.protocol(), ec);
    if (ec) {
      PORTSHARE_LOG_ERROR("tcp_server", "open", "Failed to open acceptor: " + ec.message());
      diagnostics::error_reporting::report_socket_error(requested_port_, "open", ec);
      bound->set_value(ec);
      return;
    }
  }

  acceptor_->bind(endpoint, ec);
  if (ec) {
    if (cfg_.enable_port_retry && retry_count < cfg_.max_port_retries) {
      PORTSHARE_LOG_WARNING("tcp_server", "bind",
                            "Failed to bind to port " + std::to_string(requested_port_) + " (attempt " +
                                std::to_string(retry_count + 1) + "/" + std::to_string(cfg_.max_port_retries) +
                                "): " + ec.message() + ". Retrying in " +
                                std::to_string(cfg_.port_retry_interval_ms) + "ms...");

      auto self = shared_from_this();
      retry_timer_ = std::make_unique<net::steady_timer>(ioc_);
      retry_timer_->expires_after(std::chrono::milliseconds(cfg_.port_retry_interval_ms));
      retry_timer_->async_wait([self, retry_count, bound](const boost::system::error_code& timer_ec) {
        if (timer_ec) {
          bound->set_value(timer_ec);
          return;
        }
        self->attempt_port_binding(retry_count + 1, bound);
      });
      return;
    }

    std::string error_msg = "Failed to bind to port: " + std::to_string(requested_port_) + " - " + ec.message();
    if (cfg_.enable_port_retry) {
      error_msg += " (after " + std::to_string(retry_count) + " retries)";
    }
    PORTSHARE_LOG_ERROR("tcp_server", "bind", error_msg);
    diagnostics::error_reporting::report_socket_error(requested_port_, "bind", ec);
    bound->set_value(ec);
    return;
  }

  acceptor_->listen(cfg_.backlog, ec);
  if (ec) {
    PORTSHARE_LOG_ERROR("tcp_server", "listen",
                        "Failed to listen on port: " + std::to_string(requested_port_) + " - " + ec.message());
    diagnostics::error_reporting::report_socket_error(requested_port_, "listen", ec);
    bound->set_value(ec);
    return;
  }

  auto local = acceptor_->local_endpoint(ec);
  if (ec) {
    PORTSHARE_LOG_ERROR("tcp_server", "listen", "Failed to read bound endpoint: " + ec.message());
    bound->set_value(ec);
    return;
  }
  local_port_.store(local.port());

  if (retry_count > 0) {
    PORTSHARE_LOG_INFO("tcp_server", "bind",
                       "Successfully bound to port " + std::to_string(local.port()) + " after " +
                           std::to_string(retry_count) + " retries");
  } else {
    PORTSHARE_LOG_INFO("tcp_server", "bind", "Successfully bound to port " + std::to_string(local.port()));
  }

  // The accept loop is armed before start() is released
  state_.store(State::Listening);
  do_accept();
  bound->set_value(boost::system::error_code{});
}

void TcpTestServer::do_accept() {
  if (stopping_.load() || !acceptor_->is_open()) return;

  auto self = shared_from_this();
  acceptor_->async_accept([self](const boost::system::error_code& ec, tcp::socket sock) {
    if (self->stopping_.load()) {
      return;
    }
    if (ec) {
      if (ec == net::error::operation_aborted) {
        PORTSHARE_LOG_DEBUG("tcp_server", "accept", "Accept canceled (server shutting down)");
        return;
      }
      PORTSHARE_LOG_ERROR("tcp_server", "accept", "Accept error: " + ec.message());
      diagnostics::error_reporting::report_socket_error(self->requested_port_, "accept", ec);
      self->do_accept();
      return;
    }

    boost::system::error_code ep_ec;
    auto rep = sock.remote_endpoint(ep_ec);
    std::string client_info = "unknown";
    if (!ep_ec) {
      client_info = rep.address().to_string() + ":" + std::to_string(rep.port());
    }

    std::shared_ptr<TcpServerSession> session;
    {
      std::lock_guard<std::mutex> lock(self->sessions_mutex_);
      if (self->sessions_.size() >= self->cfg_.max_connections) {
        PORTSHARE_LOG_WARNING("tcp_server", "accept",
                              "Client connection rejected - server at capacity (" +
                                  std::to_string(self->sessions_.size()) + "/" +
                                  std::to_string(self->cfg_.max_connections) + "): " + client_info);
        boost::system::error_code close_ec;
        sock.close(close_ec);
        if (close_ec) {
          PORTSHARE_LOG_DEBUG("tcp_server", "accept", "Error closing rejected socket: " + close_ec.message());
        }
      } else {
        session = std::make_shared<TcpServerSession>(std::move(sock), self->handler_);
        self->sessions_.push_back(session);
      }
    }
    if (!session) {
      self->do_accept();
      return;
    }
    ++self->total_connections_;
    PORTSHARE_LOG_DEBUG("tcp_server", "accept", "Client connected: " + client_info);

    std::weak_ptr<TcpServerSession> weak_session = session;
    std::weak_ptr<TcpTestServer> weak_server = self;
    session->on_close([weak_server, weak_session] {
      auto server = weak_server.lock();
      if (!server || server->stopping_.load()) {
        return;
      }
      auto closed = weak_session.lock();
      std::lock_guard<std::mutex> lock(server->sessions_mutex_);
      auto it = std::find(server->sessions_.begin(), server->sessions_.end(), closed);
      if (it != server->sessions_.end()) {
        server->sessions_.erase(it);
      }
    });

    session->start();
    self->do_accept();
  });
}

void TcpTestServer::close_all() {
  boost::system::error_code ec;
  if (retry_timer_) {
    retry_timer_->cancel();
  }
  if (acceptor_->is_open()) {
    acceptor_->close(ec);
    if (ec) {
      PORTSHARE_LOG_DEBUG("tcp_server", "shutdown", "Error closing acceptor: " + ec.message());
    }
  }

  std::vector<std::shared_ptr<TcpServerSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& session : sessions) {
    session->close();
  }
}

void TcpTestServer::stop_io() {
  stopping_.store(true);
  if (!ioc_thread_.joinable()) {
    close_all();
    return;
  }

  std::promise<void> closed;
  auto closed_future = closed.get_future();
  net::post(ioc_, [this, &closed] {
    close_all();
    closed.set_value();
  });
  closed_future.wait();

  // Pending handlers complete with operation_aborted and run() returns once drained
  work_guard_.reset();
  ioc_thread_.join();
}

}  // namespace transport
}  // namespace portshare
