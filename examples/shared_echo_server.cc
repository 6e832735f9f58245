#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "portshare/portshare.hpp"

namespace {
std::atomic<bool> running{true};

void signal_handler(int) { running.store(false); }
}  // namespace

// Two fixtures sharing one echo server on a port picked by the OS.
// Usage: shared_echo_server [config.yaml]
int main(int argc, char** argv) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto& logger = portshare::diagnostics::Logger::instance();
  logger.set_level(portshare::diagnostics::LogLevel::DEBUG);

  portshare::config::ServerConfig cfg;
  if (argc > 1) {
    try {
      cfg = portshare::config::load_server_config(argv[1]);
    } catch (const portshare::diagnostics::PortshareException& e) {
      std::cerr << "Failed to load " << argv[1] << ": " << e.get_full_message() << std::endl;
      return 1;
    }
  }

  auto registry = portshare::registry::SharedServerRegistry::create();
  auto builder = std::make_shared<portshare::builder::TcpServerBuilder>(cfg);

  portshare::registry::ServerLease first(registry, portshare::kAnyPort, builder);
  portshare::registry::ServerLease second(registry, portshare::kAnyPort, builder);
  try {
    first.open();
    second.open();
  } catch (const portshare::diagnostics::BuildException& e) {
    std::cerr << "Server failed to start: " << e.get_full_message() << std::endl;
    return 1;
  }

  std::cout << "Echo server listening on " << cfg.bind_address << ":" << first.local_port() << " ("
            << registry->ref_count(portshare::kAnyPort) << " holders)" << std::endl;

  first.close();
  std::cout << "First holder released, server still running: " << std::boolalpha
            << second.server()->is_running() << std::endl;

  while (running.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  second.close();
  std::cout << "Server stopped" << std::endl;
  return 0;
}
