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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mocks/mock_server.hpp"
#include "portshare/diagnostics/error_handler.hpp"
#include "portshare/diagnostics/exceptions.hpp"
#include "portshare/diagnostics/logger.hpp"
#include "portshare/registry/shared_server_registry.hpp"
#include "test_constants.hpp"
#include "test_utils.hpp"

using namespace portshare;
using namespace portshare::test;
using ::testing::Return;
using ::testing::Throw;

/**
 * @brief SharedServerRegistry tests against fake and mock servers
 */
class SharedServerRegistryTest : public BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();
    registry_ = registry::SharedServerRegistry::create();
  }

  std::shared_ptr<registry::SharedServerRegistry> registry_;
  mocks::FakeServerBuilder builder_;
};

// ============================================================================
// ACQUIRE / RELEASE
// ============================================================================

/**
 * @brief First acquire builds, later acquires reuse the same server
 */
TEST_F(SharedServerRegistryTest, RepeatedAcquireReturnsSameHandle) {
  // When: The same port is acquired three times
  auto first = registry_->acquire(8080, builder_);
  auto second = registry_->acquire(8080, builder_);
  auto third = registry_->acquire(8080, builder_);

  // Then: One build, one handle, three holders
  EXPECT_EQ(builder_.build_count(), 1);
  EXPECT_EQ(first, second);
  EXPECT_EQ(second, third);
  EXPECT_EQ(registry_->ref_count(8080), 3u);
  EXPECT_EQ(first->local_port(), 8080);
}

/**
 * @brief A port has an entry exactly while its count is positive
 */
TEST_F(SharedServerRegistryTest, EntryExistsOnlyWhileHeld) {
  EXPECT_FALSE(registry_->is_registered(9000));
  EXPECT_EQ(registry_->ref_count(9000), 0u);

  registry_->acquire(9000, builder_);
  registry_->acquire(9000, builder_);
  EXPECT_TRUE(registry_->is_registered(9000));

  registry_->release(9000);
  EXPECT_TRUE(registry_->is_registered(9000));
  EXPECT_EQ(registry_->ref_count(9000), 1u);

  registry_->release(9000);
  EXPECT_FALSE(registry_->is_registered(9000));
  EXPECT_EQ(registry_->ref_count(9000), 0u);
  EXPECT_EQ(registry_->find(9000), nullptr);
  EXPECT_EQ(registry_->size(), 0u);
}

/**
 * @brief The last release shuts the server down exactly once
 */
TEST_F(SharedServerRegistryTest, LastReleaseShutsDownOnce) {
  registry_->acquire(9001, builder_);
  registry_->acquire(9001, builder_);
  auto server = builder_.last_built();

  registry_->release(9001);
  EXPECT_EQ(server->shutdown_count(), 0);

  registry_->release(9001);
  EXPECT_EQ(server->shutdown_count(), 1);
}

/**
 * @brief After a full release the next acquire builds a fresh server
 */
TEST_F(SharedServerRegistryTest, AcquireAfterFullReleaseRebuilds) {
  auto old_handle = registry_->acquire(9002, builder_);
  registry_->release(9002);

  auto new_handle = registry_->acquire(9002, builder_);

  EXPECT_EQ(builder_.build_count(), 2);
  EXPECT_NE(old_handle, new_handle);
  EXPECT_EQ(registry_->ref_count(9002), 1u);
}

/**
 * @brief Different ports get independent servers
 */
TEST_F(SharedServerRegistryTest, PortsAreIndependent) {
  auto a = registry_->acquire(9100, builder_);
  auto b = registry_->acquire(9200, builder_);
  registry_->acquire(9200, builder_);

  EXPECT_NE(a, b);
  EXPECT_EQ(registry_->registered_ports(), (std::vector<uint16_t>{9100, 9200}));

  registry_->release(9200);
  EXPECT_EQ(registry_->ref_count(9100), 1u);
  EXPECT_EQ(registry_->ref_count(9200), 1u);
}

/**
 * @brief Two holders on port 7: the server survives the first release
 */
TEST_F(SharedServerRegistryTest, TwoHoldersShareServerUntilBothRelease) {
  // Given: Holder A and holder B acquire port 7
  auto a = registry_->acquire(7, builder_);
  auto b = registry_->acquire(7, builder_);
  ASSERT_EQ(a, b);
  auto server = builder_.last_built();

  // When: A releases
  registry_->release(7);

  // Then: B still has a running server
  EXPECT_TRUE(server->is_running());
  EXPECT_EQ(registry_->ref_count(7), 1u);
  EXPECT_EQ(registry_->find(7), b);

  // When: B releases
  registry_->release(7);

  // Then: The server is shut down once and forgotten
  EXPECT_EQ(server->shutdown_count(), 1);
  EXPECT_FALSE(registry_->is_registered(7));
  EXPECT_EQ(builder_.build_count(), 1);
}

// ============================================================================
// SENTINEL PORT
// ============================================================================

/**
 * @brief Port 0 is shared under the requested key, not the bound port
 */
TEST_F(SharedServerRegistryTest, AnyPortIsDeduplicated) {
  auto first = registry_->acquire(kAnyPort, builder_);
  auto second = registry_->acquire(kAnyPort, builder_);

  EXPECT_EQ(builder_.build_count(), 1);
  EXPECT_EQ(first, second);
  EXPECT_NE(first->local_port(), kAnyPort);
  EXPECT_EQ(registry_->ref_count(kAnyPort), 2u);
  EXPECT_FALSE(registry_->is_registered(first->local_port()));
  EXPECT_EQ(registry_->registered_ports(), (std::vector<uint16_t>{kAnyPort}));
}

/**
 * @brief Acquiring the bound port explicitly does not alias the sentinel entry
 */
TEST_F(SharedServerRegistryTest, BoundPortIsSeparateKey) {
  auto any = registry_->acquire(kAnyPort, builder_);
  auto explicit_port = registry_->acquire(any->local_port(), builder_);

  EXPECT_EQ(builder_.build_count(), 2);
  EXPECT_NE(any, explicit_port);
  EXPECT_EQ(registry_->size(), 2u);
}

// ============================================================================
// FAILURES
// ============================================================================

/**
 * @brief Release without acquire is rejected and reported
 */
TEST_F(SharedServerRegistryTest, ReleaseWithoutAcquireThrows) {
  EXPECT_THROW(registry_->release(1234), diagnostics::ReleaseWithoutHolderException);

  auto errors = diagnostics::ErrorHandler::instance().errors_for_port(1234);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].category, diagnostics::ErrorCategory::LIFECYCLE);
  EXPECT_EQ(errors[0].level, diagnostics::ErrorLevel::CRITICAL);
  EXPECT_EQ(errors[0].component, "registry");
  EXPECT_EQ(diagnostics::ErrorHandler::instance().lifecycle_violations(), 1u);
}

/**
 * @brief Releasing once more than acquired does not disturb other ports
 */
TEST_F(SharedServerRegistryTest, OverReleaseLeavesStateUntouched) {
  registry_->acquire(5000, builder_);
  registry_->acquire(6000, builder_);
  auto server_6000 = builder_.last_built();
  registry_->release(5000);

  try {
    registry_->release(5000);
    FAIL() << "Expected ReleaseWithoutHolderException";
  } catch (const diagnostics::ReleaseWithoutHolderException& e) {
    EXPECT_EQ(e.get_port(), 5000);
    EXPECT_EQ(e.get_code(), ErrorCode::ReleaseWithoutHolder);
  }

  EXPECT_EQ(registry_->ref_count(6000), 1u);
  EXPECT_EQ(server_6000->shutdown_count(), 0);
  EXPECT_EQ(registry_->registered_ports(), (std::vector<uint16_t>{6000}));
}

/**
 * @brief A failed build stores nothing and the next acquire tries again
 */
TEST_F(SharedServerRegistryTest, FailedBuildLeavesNoEntry) {
  builder_.fail_next(1);

  EXPECT_THROW(registry_->acquire(7000, builder_), diagnostics::BuildException);
  EXPECT_FALSE(registry_->is_registered(7000));
  EXPECT_EQ(registry_->ref_count(7000), 0u);

  auto stats = diagnostics::ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.count(diagnostics::ErrorCategory::BUILD), 1u);

  // When: Retried
  auto server = registry_->acquire(7000, builder_);

  // Then: Built fresh and counted once
  EXPECT_NE(server, nullptr);
  EXPECT_EQ(builder_.build_count(), 2);
  EXPECT_EQ(registry_->ref_count(7000), 1u);
}

/**
 * @brief A failed build does not affect existing holders of other ports
 */
TEST_F(SharedServerRegistryTest, FailedBuildKeepsOtherEntries) {
  registry_->acquire(7100, builder_);
  builder_.fail_next(1);

  EXPECT_THROW(registry_->acquire(7200, builder_), diagnostics::BuildException);

  EXPECT_EQ(registry_->ref_count(7100), 1u);
  EXPECT_EQ(registry_->size(), 1u);
}

/**
 * @brief Shutdown errors propagate but the entry is already gone
 */
TEST_F(SharedServerRegistryTest, ShutdownFailurePropagatesAfterRemoval) {
  registry_->acquire(7300, builder_);
  builder_.last_built()->fail_shutdown(true);

  EXPECT_THROW(registry_->release(7300), std::runtime_error);

  EXPECT_FALSE(registry_->is_registered(7300));
  EXPECT_THROW(registry_->release(7300), diagnostics::ReleaseWithoutHolderException);
}

// ============================================================================
// MOCKED COLLABORATORS
// ============================================================================

/**
 * @brief The builder receives the requested port and shutdown is called once
 */
TEST_F(SharedServerRegistryTest, BuilderAndHandleContract) {
  mocks::MockServerBuilder builder;
  auto handle = std::make_shared<mocks::MockServerHandle>();

  EXPECT_CALL(builder, build(4321)).WillOnce(Return(handle));
  EXPECT_CALL(*handle, local_port()).WillRepeatedly(Return(4321));
  EXPECT_CALL(*handle, shutdown()).Times(1);

  registry_->acquire(4321, builder);
  registry_->acquire(4321, builder);
  registry_->release(4321);
  registry_->release(4321);
}

/**
 * @brief BuildException thrown by a builder keeps its error code
 */
TEST_F(SharedServerRegistryTest, BuildExceptionPassesThrough) {
  mocks::MockServerBuilder builder;
  EXPECT_CALL(builder, build(4400))
      .WillOnce(Throw(diagnostics::BuildException("in use", 4400, "builder", ErrorCode::PortInUse)));

  try {
    registry_->acquire(4400, builder);
    FAIL() << "Expected BuildException";
  } catch (const diagnostics::BuildException& e) {
    EXPECT_EQ(e.get_code(), ErrorCode::PortInUse);
    EXPECT_EQ(e.get_port(), 4400);
  }
  EXPECT_FALSE(registry_->is_registered(4400));
}

/**
 * @brief A builder returning no server counts as a failed build
 */
TEST_F(SharedServerRegistryTest, NullServerIsBuildFailure) {
  mocks::MockServerBuilder builder;
  EXPECT_CALL(builder, build(4500)).WillOnce(Return(nullptr));

  EXPECT_THROW(registry_->acquire(4500, builder), diagnostics::BuildException);
  EXPECT_FALSE(registry_->is_registered(4500));
}

// ============================================================================
// RE-ENTRANT DIAGNOSTICS
// ============================================================================

/**
 * @brief An error callback may inspect the registry that reported the error
 */
TEST_F(SharedServerRegistryTest, OverReleaseCallbackCanQueryRegistry) {
  std::vector<size_t> seen_counts;
  diagnostics::ErrorHandler::instance().register_callback(
      [this, &seen_counts](const diagnostics::ErrorInfo& info) {
        seen_counts.push_back(registry_->ref_count(*info.port));
      });

  EXPECT_THROW(registry_->release(1), diagnostics::ReleaseWithoutHolderException);

  EXPECT_EQ(seen_counts, (std::vector<size_t>{0}));
}

TEST_F(SharedServerRegistryTest, BuildFailureCallbackSeesPortAbsent) {
  std::vector<bool> seen_registered;
  diagnostics::ErrorHandler::instance().register_callback(
      [this, &seen_registered](const diagnostics::ErrorInfo& info) {
        seen_registered.push_back(registry_->is_registered(*info.port));
      });
  builder_.fail_next(1);

  EXPECT_THROW(registry_->acquire(7400, builder_), diagnostics::BuildException);

  EXPECT_EQ(seen_registered, (std::vector<bool>{false}));
}

TEST_F(SharedServerRegistryTest, ShutdownFailureCallbackSeesEntryRemoved) {
  registry_->acquire(7500, builder_);
  builder_.last_built()->fail_shutdown(true);

  std::vector<size_t> seen_sizes;
  diagnostics::ErrorHandler::instance().register_callback(
      [this, &seen_sizes](const diagnostics::ErrorInfo&) { seen_sizes.push_back(registry_->size()); });

  EXPECT_THROW(registry_->release(7500), std::runtime_error);

  EXPECT_EQ(seen_sizes, (std::vector<size_t>{0}));
  auto errors = diagnostics::ErrorHandler::instance().errors_for_port(7500);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].category, diagnostics::ErrorCategory::SHUTDOWN);
}

/**
 * @brief A log sink may query the registry while acquire and release log
 */
TEST_F(SharedServerRegistryTest, LogSinkCanQueryRegistry) {
  std::vector<std::string> lines;
  diagnostics::Logger::instance().set_level(diagnostics::LogLevel::DEBUG);
  diagnostics::Logger::instance().set_sink([this, &lines](diagnostics::LogLevel, const std::string& line) {
    lines.push_back(line + " #" + std::to_string(registry_->ref_count(7600)));
  });

  registry_->acquire(7600, builder_);
  registry_->acquire(7600, builder_);
  registry_->release(7600);
  registry_->release(7600);
  diagnostics::Logger::instance().set_sink(nullptr);

  ASSERT_EQ(lines.size(), 4u);
  EXPECT_NE(lines[0].find("Started new server at port 7600 #1"), std::string::npos);
  EXPECT_NE(lines[1].find("Using existing server at port 7600 (2 holders) #2"), std::string::npos);
  EXPECT_NE(lines[3].find("Closed server at port 7600 (requested 7600) #0"), std::string::npos);
}

// ============================================================================
// LIFETIME AND CONCURRENCY
// ============================================================================

/**
 * @brief Destroying the registry shuts down servers that were never released
 */
TEST_F(SharedServerRegistryTest, DestructorShutsDownLeakedServers) {
  registry_->acquire(7400, builder_);
  auto server = builder_.last_built();

  registry_.reset();

  EXPECT_EQ(server->shutdown_count(), 1);
}

/**
 * @brief Many holders acquiring at once get one build and one shutdown
 */
TEST_F(SharedServerRegistryTest, ConcurrentHoldersShareOneServer) {
  const int holders = constants::kConcurrentHolders;
  std::atomic<int> acquired{0};
  std::vector<registry::SharedServerRegistry::ServerHandle> handles(holders);
  std::vector<std::thread> threads;

  for (int i = 0; i < holders; ++i) {
    threads.emplace_back([&, i] {
      handles[i] = registry_->acquire(7500, builder_);
      ++acquired;
      // Hold until every thread has acquired so no release can reach zero early
      while (acquired.load() < holders) {
        std::this_thread::yield();
      }
      registry_->release(7500);
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(builder_.build_count(), 1);
  for (const auto& handle : handles) {
    EXPECT_EQ(handle, handles.front());
  }
  EXPECT_EQ(builder_.last_built()->shutdown_count(), 1);
  EXPECT_FALSE(registry_->is_registered(7500));
}

/**
 * @brief Interleaved acquire/release cycles keep counts balanced
 */
TEST_F(SharedServerRegistryTest, ConcurrentCyclesEndEmpty) {
  std::vector<std::thread> threads;
  for (int i = 0; i < constants::kConcurrentHolders; ++i) {
    threads.emplace_back([this, i] {
      uint16_t port = static_cast<uint16_t>(7600 + (i % 4));
      for (int round = 0; round < 50; ++round) {
        registry_->acquire(port, builder_);
        registry_->release(port);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(registry_->size(), 0u);
  EXPECT_GE(builder_.build_count(), 4);
}
