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

#include "portshare/diagnostics/logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace portshare {
namespace diagnostics {

namespace {

std::string timestamp_now() {
  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm local{};
#if defined(_WIN32)
  ::localtime_s(&local, &seconds);
#else
  ::localtime_r(&seconds, &local);
#endif
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
  return out.str();
}

}  // namespace

struct Logger::Impl {
  std::atomic<LogLevel> level{LogLevel::INFO};
  std::mutex mutex;
  Sink sink;

  void write(LogLevel line_level, const std::string& line) {
    Sink current;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (!sink) {
        (line_level >= LogLevel::ERROR ? std::cerr : std::cout) << line << '\n';
        return;
      }
      current = sink;
    }
    // Outside the lock so a sink may log again
    current(line_level, line);
  }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
  // Leaked so that servers shut down from static destructors can still log
  static Logger* logger = new Logger();
  return *logger;
}

void Logger::set_level(LogLevel level) { impl_->level.store(level); }

LogLevel Logger::get_level() const { return impl_->level.load(); }

void Logger::set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->sink = std::move(sink);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!should_log(level)) {
    return;
  }
  std::string line = timestamp_now();
  line.append(" [").append(level_to_string(level)).append("] [");
  line.append(component).append("] [").append(operation).append("] ");
  line.append(message);
  impl_->write(level, line);
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

std::string_view Logger::level_to_string(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

}  // namespace diagnostics
}  // namespace portshare
