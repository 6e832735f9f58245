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

#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "portshare/base/visibility.hpp"
#include "portshare/config/server_config.hpp"
#include "portshare/interface/iserver_handle.hpp"
#include "portshare/interface/itcp_acceptor.hpp"
#include "portshare/transport/tcp_server/tcp_server_session.hpp"

namespace portshare {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Small multi-client TCP server used as a shared test fixture
 *
 * The server owns its io_context and runs it on a worker thread. start()
 * blocks until the listening socket is bound (or binding failed), so the
 * bound port is known as soon as start() returns.
 *
 * Must be owned by a std::shared_ptr before start() is called.
 */
class PORTSHARE_API TcpTestServer : public interface::ServerHandleInterface,
                                    public std::enable_shared_from_this<TcpTestServer> {
 public:
  using DataHandler = TcpServerSession::DataHandler;
  using AcceptorFactory = std::function<std::unique_ptr<interface::TcpAcceptorInterface>(net::io_context&)>;

  enum class State { Idle, Listening, Closed, Error };

  /**
   * @param handler Called for every chunk received; nullptr echoes data back
   */
  TcpTestServer(const config::ServerConfig& cfg, uint16_t port, DataHandler handler = nullptr);

  // Dependency injection constructor
  TcpTestServer(const config::ServerConfig& cfg, uint16_t port, DataHandler handler, AcceptorFactory acceptor_factory);

  ~TcpTestServer() override;

  TcpTestServer(const TcpTestServer&) = delete;
  TcpTestServer& operator=(const TcpTestServer&) = delete;

  /**
   * @brief Bind, listen and start accepting
   * @throws diagnostics::BuildException if the port could not be bound in time
   * @throws diagnostics::StateException if the server was already shut down
   */
  void start();

  uint16_t local_port() const override;
  bool is_running() const override;

  /**
   * @brief Close the acceptor and every session, then join the worker thread
   *
   * Safe to call more than once. Must not be called from a data handler.
   */
  void shutdown() override;

  uint16_t requested_port() const { return requested_port_; }
  State state() const { return state_.load(); }

  size_t connection_count() const;
  size_t total_connections() const { return total_connections_.load(); }

 private:
  using BindPromise = std::shared_ptr<std::promise<boost::system::error_code>>;

  void attempt_port_binding(int retry_count, BindPromise bound);
  void do_accept();
  void close_all();
  void stop_io();

 private:
  config::ServerConfig cfg_;
  uint16_t requested_port_;
  DataHandler handler_;

  net::io_context ioc_;
  std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
  std::thread ioc_thread_;
  std::unique_ptr<interface::TcpAcceptorInterface> acceptor_;
  std::unique_ptr<net::steady_timer> retry_timer_;

  std::atomic<uint16_t> local_port_{0};
  std::atomic<State> state_{State::Idle};
  std::atomic<bool> stopping_{false};

  mutable std::mutex sessions_mutex_;
  std::vector<std::shared_ptr<TcpServerSession>> sessions_;
  std::atomic<size_t> total_connections_{0};
};

}  // namespace transport
}  // namespace portshare
