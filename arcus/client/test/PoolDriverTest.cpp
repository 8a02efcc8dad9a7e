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
#include "arcus/client/PoolDriver.h"
#include "arcus/client/test/MockCacheClient.h"

using ::testing::InSequence;
using ::testing::NiceMock;

namespace arcus {
namespace client {

class PoolDriverFixture : public ::testing::Test {
 public:
  void SetUp() override {
    factory_ = std::make_shared<RecordingCacheClientFactory>();
  }

 protected:
  std::unique_ptr<PoolDriver> newDriver(
      size_t poolSize,
      std::chrono::milliseconds wait = std::chrono::milliseconds(0),
      std::shared_ptr<IConnectionObserver> observer = nullptr) {
    CoordinatorConfig config("zk:2181", "svc");
    config.setPoolSize(poolSize).setWaitTimeForConnect(wait);
    return std::make_unique<PoolDriver>(config, factory_, std::move(observer));
  }

  static std::chrono::milliseconds timeBuild(
      PoolDriver& driver,
      ClusterMode mode,
      const EndpointList& addresses) {
    auto start = std::chrono::steady_clock::now();
    driver.buildInitial(mode, addresses);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
  }

  std::shared_ptr<RecordingCacheClientFactory> factory_;
};

TEST(PoolDriverTest, connectBudget) {
  EXPECT_EQ(
      std::chrono::milliseconds(100),
      PoolDriver::getConnectBudget(std::chrono::milliseconds(0), 2));
  EXPECT_EQ(
      std::chrono::milliseconds(0),
      PoolDriver::getConnectBudget(std::chrono::milliseconds(0), 0));
  EXPECT_EQ(
      std::chrono::milliseconds(700),
      PoolDriver::getConnectBudget(std::chrono::milliseconds(700), 2));
}

TEST_F(PoolDriverFixture, buildWaitsDefaultBudgetForTwoEndpoints) {
  auto driver = newDriver(3);
  auto elapsed = timeBuild(
      *driver, ClusterMode::SIMPLE, {"10.0.0.1:11211", "10.0.0.2:11211"});

  EXPECT_GE(elapsed, std::chrono::milliseconds(100));
  ASSERT_EQ(3, factory_->numCalls());
  for (size_t i = 0; i < 3; ++i) {
    auto call = factory_->getCall(i);
    EXPECT_EQ(ClusterMode::SIMPLE, call.mode);
    EXPECT_EQ("svc-" + std::to_string(i), call.name);
    EXPECT_EQ(
        (std::vector<std::string>{"10.0.0.1:11211", "10.0.0.2:11211"}),
        call.endpoints);
  }
  auto pool = driver->getPool();
  ASSERT_TRUE(pool);
  EXPECT_EQ(3, pool->size());
  EXPECT_TRUE(driver->waitUntilReady(std::chrono::milliseconds(0)));
}

TEST_F(PoolDriverFixture, latchCountsEachRealEndpointOnce) {
  auto driver = newDriver(1, std::chrono::milliseconds(500));

  // the same endpoint twice does not satisfy a target of two
  factory_->onCreate = [](IConnectionObserver& o) {
    o.connectionEstablished("10.0.0.1:11211", 0);
    o.connectionEstablished("10.0.0.1:11211", 1);
  };
  auto elapsed = timeBuild(
      *driver, ClusterMode::SIMPLE, {"10.0.0.1:11211", "10.0.0.2:11211"});
  EXPECT_GE(elapsed, std::chrono::milliseconds(500));
}

TEST_F(PoolDriverFixture, buildReturnsOnceAllEndpointsConnect) {
  auto driver = newDriver(1, std::chrono::milliseconds(5000));
  factory_->onCreate = [](IConnectionObserver& o) {
    o.connectionEstablished("10.0.0.1:11211", 0);
    o.connectionEstablished("10.0.0.2:11211", 0);
  };
  auto elapsed = timeBuild(
      *driver, ClusterMode::SIMPLE, {"10.0.0.1:11211", "10.0.0.2:11211"});
  EXPECT_LT(elapsed, std::chrono::milliseconds(5000));
}

TEST_F(PoolDriverFixture, fakeEndpointIsNotWaitedFor) {
  auto driver = newDriver(1, std::chrono::milliseconds(5000));
  factory_->onCreate = [](IConnectionObserver& o) {
    o.connectionEstablished("10.0.0.1:11211", 0);
  };
  auto elapsed = timeBuild(
      *driver,
      ClusterMode::REPLICATION,
      {"g0^M^10.0.0.1:11211-cache1", "g1^M^0.0.0.0:23456"});
  EXPECT_LT(elapsed, std::chrono::milliseconds(5000));
  EXPECT_EQ(
      (std::vector<std::string>{"g0^M^10.0.0.1:11211-cache1",
                                "g1^M^0.0.0.0:23456"}),
      factory_->getCall(0).endpoints);
}

TEST_F(PoolDriverFixture, secondBuildUpdatesInstead) {
  auto driver = newDriver(2, std::chrono::milliseconds(1));
  driver->buildInitial(ClusterMode::SIMPLE, {"10.0.0.1:11211"});
  auto pool = driver->getPool();

  for (size_t i = 0; i < 2; ++i) {
    auto* client = factory_->getClient(i);
    InSequence seq;
    EXPECT_CALL(*client, pushAddressUpdate("10.0.0.1:11211,10.0.0.2:11211"));
    EXPECT_CALL(*client, wakeEventLoop());
  }
  driver->buildInitial(
      ClusterMode::SIMPLE, {"10.0.0.1:11211", "10.0.0.2:11211"});

  EXPECT_EQ(2, factory_->numCalls());
  EXPECT_EQ(pool, driver->getPool());
}

TEST_F(PoolDriverFixture, failedSlotIsSkipped) {
  factory_->failingSlots = {1};
  auto driver = newDriver(3, std::chrono::milliseconds(1));
  driver->buildInitial(ClusterMode::SIMPLE, {"10.0.0.1:11211"});

  EXPECT_TRUE(driver->waitUntilReady(std::chrono::milliseconds(0)));
  auto pool = driver->getPool();
  ASSERT_EQ(3, pool->size());
  EXPECT_TRUE((*pool)[0]);
  EXPECT_FALSE((*pool)[1]);
  EXPECT_TRUE((*pool)[2]);

  for (size_t i : {0, 2}) {
    auto* client = factory_->getClient(i);
    EXPECT_CALL(*client, pushAddressUpdate("10.0.0.3:11211"));
    EXPECT_CALL(*client, wakeEventLoop());
  }
  driver->updateAddresses(ClusterMode::SIMPLE, {"10.0.0.3:11211"});
}

TEST_F(PoolDriverFixture, updateWithoutPoolBuilds) {
  auto driver = newDriver(1, std::chrono::milliseconds(1));
  EXPECT_FALSE(driver->getPool());
  driver->updateAddresses(ClusterMode::REPLICATION, {"g0^M^10.0.0.1:11211"});
  EXPECT_EQ(1, factory_->numCalls());
  EXPECT_EQ(ClusterMode::REPLICATION, factory_->getCall(0).mode);
  EXPECT_TRUE(driver->getPool());
}

TEST_F(PoolDriverFixture, nodeListChanges) {
  auto driver = newDriver(1, std::chrono::milliseconds(1));

  driver->onNodeListChanged(ClusterMode::SIMPLE, {});
  EXPECT_EQ(0, factory_->numCalls());
  EXPECT_FALSE(driver->getPool());
  EXPECT_FALSE(driver->waitUntilReady(std::chrono::milliseconds(10)));

  driver->onNodeListChanged(
      ClusterMode::SIMPLE, {"10.0.0.1:11211-cache1", "10.0.0.2:11211-cache2"});
  ASSERT_EQ(1, factory_->numCalls());
  EXPECT_EQ(
      (std::vector<std::string>{"10.0.0.1:11211", "10.0.0.2:11211"}),
      factory_->getCall(0).endpoints);
  EXPECT_TRUE(driver->waitUntilReady(std::chrono::milliseconds(0)));

  auto* client = factory_->getClient(0);
  EXPECT_CALL(*client, pushAddressUpdate("10.0.0.2:11211"));
  EXPECT_CALL(*client, wakeEventLoop());
  driver->onNodeListChanged(ClusterMode::SIMPLE, {"10.0.0.2:11211-cache2"});

  // an empty list leaves the pool alone
  EXPECT_CALL(*client, pushAddressUpdate(::testing::_)).Times(0);
  driver->onNodeListChanged(ClusterMode::SIMPLE, {});
  EXPECT_EQ(1, factory_->numCalls());
}

TEST_F(PoolDriverFixture, observerEventsAreForwarded) {
  auto observer = std::make_shared<NiceMock<MockConnectionObserver>>();
  EXPECT_CALL(*observer, connectionEstablished("10.0.0.1:11211", 0));
  EXPECT_CALL(*observer, connectionLost("10.0.0.1:11211"));

  auto driver = newDriver(1, std::chrono::milliseconds(1), observer);
  driver->buildInitial(ClusterMode::SIMPLE, {"10.0.0.1:11211"});

  auto forwarded = factory_->getObserver();
  forwarded->connectionEstablished("10.0.0.1:11211", 0);
  forwarded->connectionLost("10.0.0.1:11211");
}
}
}
