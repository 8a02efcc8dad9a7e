/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>
#include <atomic>
#include "arcus/client/ClusterCoordinator.h"
#include "arcus/client/test/InMemoryZookeeperClient.h"
#include "arcus/client/test/MockCacheClient.h"

using ::testing::AtLeast;
using ::testing::Invoke;

namespace arcus {
namespace client {

class ClusterCoordinatorFixture : public ::testing::Test {
 public:
  void SetUp() override {
    store_ = std::make_shared<InMemoryZookeeperStore>();
    sessions_ = std::make_unique<InMemorySessionRecorder>(store_);
    factory_ = std::make_shared<RecordingCacheClientFactory>();
    config_.setPoolSize(2)
        .setConnectTimeout(std::chrono::milliseconds(50))
        .setRetryDelay(std::chrono::milliseconds(100));
  }

 protected:
  std::unique_ptr<ClusterCoordinator> newCoordinator() {
    return std::make_unique<ClusterCoordinator>(
        config_, factory_, sessions_->factory(), nullptr, [] {
          return LocalHost{"myhost", "10.1.2.3"};
        });
  }

  CoordinatorConfig config_{"zk:2181", "svc"};
  std::shared_ptr<InMemoryZookeeperStore> store_;
  std::unique_ptr<InMemorySessionRecorder> sessions_;
  std::shared_ptr<RecordingCacheClientFactory> factory_;
};

TEST_F(ClusterCoordinatorFixture, poolFollowsMembership) {
  store_->addNode("/arcus/cache_list/svc/10.0.0.1:11211-cache1");
  store_->addNode("/arcus/client_list/svc");

  auto coordinator = newCoordinator();
  ASSERT_TRUE(coordinator->waitUntilReady(std::chrono::milliseconds(5000)));
  EXPECT_EQ(LifecycleState::CONNECTED, coordinator->getState());
  EXPECT_EQ(ClusterMode::SIMPLE, coordinator->getClusterMode().value());

  auto pool = coordinator->getPool();
  ASSERT_TRUE(pool);
  ASSERT_EQ(2, pool->size());
  ASSERT_EQ(2, factory_->numCalls());
  EXPECT_EQ(
      std::vector<std::string>{"10.0.0.1:11211"},
      factory_->getCall(0).endpoints);

  for (size_t i = 0; i < 2; ++i) {
    auto client = factory_->getClient(i);
    EXPECT_CALL(*client, pushAddressUpdate("10.0.0.1:11211,10.0.0.2:11211"));
    EXPECT_CALL(*client, wakeEventLoop()).Times(AtLeast(1));
  }
  store_->addNode("/arcus/cache_list/svc/10.0.0.2:11211-cache2");

  EXPECT_EQ(pool, coordinator->getPool());
  EXPECT_EQ(2, factory_->numCalls());
}

TEST_F(ClusterCoordinatorFixture, unknownServiceFailsConstruction) {
  store_->addNode("/arcus/client_list/svc");
  EXPECT_THROW(newCoordinator(), ServiceNotFoundException);
  EXPECT_EQ(0, factory_->numCalls());
  EXPECT_TRUE(sessions_->getSession(0)->isClosed());
}

TEST_F(ClusterCoordinatorFixture, shutdownWithdrawsPresence) {
  store_->addNode("/arcus_repl/cache_list/svc/g0^M^10.0.0.1:11211-cache1");
  store_->addNode("/arcus_repl/client_list/svc");

  auto coordinator = newCoordinator();
  ASSERT_TRUE(coordinator->waitUntilReady(std::chrono::milliseconds(5000)));
  EXPECT_EQ(ClusterMode::REPLICATION, factory_->getCall(0).mode);
  EXPECT_EQ(1, store_->getChildren("/arcus_repl/client_list/svc").size());

  coordinator->shutdown();
  EXPECT_EQ(LifecycleState::SHUTTING_DOWN, coordinator->getState());
  EXPECT_TRUE(store_->getChildren("/arcus_repl/client_list/svc").empty());
  EXPECT_TRUE(sessions_->getSession(0)->isClosed());

  // the pool outlives the session
  EXPECT_TRUE(coordinator->getPool());
}

TEST_F(ClusterCoordinatorFixture, sessionExpiryKeepsPool) {
  store_->addNode("/arcus/cache_list/svc/10.0.0.1:11211-cache1");
  store_->addNode("/arcus/client_list/svc");

  auto coordinator = newCoordinator();
  ASSERT_TRUE(coordinator->waitUntilReady(std::chrono::milliseconds(5000)));
  auto pool = coordinator->getPool();
  std::atomic<int> pushes{0};
  for (size_t i = 0; i < 2; ++i) {
    EXPECT_CALL(*factory_->getClient(i), pushAddressUpdate("10.0.0.1:11211"))
        .Times(AtLeast(1))
        .WillRepeatedly(Invoke([&pushes](const std::string&) { ++pushes; }));
  }

  sessions_->getSession(0)->expire();
  ASSERT_TRUE(waitFor([&] {
    return sessions_->numSessions() == 2 &&
        store_->getChildren("/arcus/client_list/svc").size() == 1 &&
        coordinator->getState() == LifecycleState::CONNECTED;
  }));
  // the new session's first listing reaches the existing clients
  ASSERT_TRUE(waitFor([&] { return pushes >= 2; }));

  EXPECT_EQ(pool, coordinator->getPool());
  EXPECT_EQ(2, factory_->numCalls());
}
}
}
