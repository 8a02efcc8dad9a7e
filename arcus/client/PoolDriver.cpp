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

#include "arcus/client/PoolDriver.h"
#include <folly/Conv.h>
#include <glog/logging.h>
#include <set>
#include "arcus/client/Endpoint.h"

namespace arcus {
namespace client {

constexpr std::chrono::milliseconds PoolDriver::kConnectWaitPerEndpoint;

/**
 * Counts the first connect of every distinct real endpoint and forwards all
 * events to the user's observer.
 */
class PoolDriver::StartupObserver : public IConnectionObserver {
 public:
  StartupObserver(size_t expected, std::shared_ptr<IConnectionObserver> next)
      : latch_(expected), next_(std::move(next)) {}

  void connectionEstablished(const std::string& endpoint, int reconnectCount)
      override {
    if (!isFake(endpoint)) {
      std::unique_lock<std::mutex> g(lock_);
      bool first = connected_.insert(endpoint).second;
      g.unlock();
      if (first) {
        latch_.countDown();
      }
    }
    if (next_) {
      next_->connectionEstablished(endpoint, reconnectCount);
    }
  }

  void connectionLost(const std::string& endpoint) override {
    if (next_) {
      next_->connectionLost(endpoint);
    }
  }

  bool await(std::chrono::milliseconds timeout) {
    return latch_.await(timeout);
  }

 private:
  static bool isFake(const std::string& endpoint) {
    try {
      return parseEndpoint(endpoint).isFake();
    } catch (const std::invalid_argument&) {
      return false;
    }
  }

  detail::CountDownLatch latch_;
  std::shared_ptr<IConnectionObserver> next_;
  std::mutex lock_;
  std::set<std::string> connected_;
};

PoolDriver::PoolDriver(
    const CoordinatorConfig& config,
    std::shared_ptr<ICacheClientFactory> factory,
    std::shared_ptr<IConnectionObserver> userObserver)
    : config_(config),
      factory_(std::move(factory)),
      userObserver_(std::move(userObserver)),
      initLatch_(1) {
  if (!factory_) {
    throw std::invalid_argument("cache client factory must not be null");
  }
}

std::chrono::milliseconds PoolDriver::getConnectBudget(
    std::chrono::milliseconds configured,
    size_t realEndpoints) {
  if (configured.count() > 0) {
    return configured;
  }
  return kConnectWaitPerEndpoint * static_cast<int64_t>(realEndpoints);
}

void PoolDriver::onNodeListChanged(
    ClusterMode mode,
    const std::vector<std::string>& rawNames) {
  auto addresses = translate(mode, rawNames);
  if (addresses.empty()) {
    LOG(WARNING) << "no cache servers listed for "
                 << config_.getServiceCode() << ", keeping current pool";
    return;
  }
  if (getPool()) {
    updateAddresses(mode, addresses);
  } else {
    buildInitial(mode, addresses);
  }
}

void PoolDriver::buildInitial(
    ClusterMode mode,
    const EndpointList& addresses) {
  std::unique_lock<std::mutex> g(buildLock_);
  if (getPool()) {
    g.unlock();
    updateAddresses(mode, addresses);
    return;
  }

  auto realEndpoints = countRealEndpoints(parseEndpoints(mode, addresses));
  auto observer =
      std::make_shared<StartupObserver>(realEndpoints, userObserver_);

  auto pool = std::make_shared<ClientPool>(config_.getPoolSize());
  for (size_t i = 0; i < pool->size(); ++i) {
    auto name = folly::to<std::string>(config_.getServiceCode(), "-", i);
    try {
      (*pool)[i] = factory_->create(mode, name, addresses, observer);
    } catch (const CacheClientIOException& e) {
      LOG(ERROR) << "fatal: can't create cache client " << name << ": "
                 << e.what();
    }
  }
  *pool_.wlock() = pool;
  LOG(INFO) << "built pool of " << pool->size() << " cache clients for "
            << config_.getServiceCode() << " (" << toString(mode) << ", "
            << addresses.size() << " endpoints)";

  auto budget =
      getConnectBudget(config_.getWaitTimeForConnect(), realEndpoints);
  if (!observer->await(budget)) {
    LOG(WARNING) << "Some connections are not established. serviceCode="
                 << config_.getServiceCode() << ", waited " << budget.count()
                 << "ms";
  }
  initLatch_.countDown();
}

void PoolDriver::updateAddresses(
    ClusterMode mode,
    const EndpointList& addresses) {
  auto pool = getPool();
  if (!pool) {
    buildInitial(mode, addresses);
    return;
  }
  pushAddresses(*pool, addresses);
}

void PoolDriver::pushAddresses(
    const ClientPool& pool,
    const EndpointList& addresses) {
  auto text = joinEndpoints(addresses);
  VLOG(1) << "pushing addresses to " << pool.size() << " clients: " << text;
  for (const auto& client : pool) {
    if (!client) {
      continue;
    }
    client->pushAddressUpdate(text);
    client->wakeEventLoop();
  }
}

std::shared_ptr<const ClientPool> PoolDriver::getPool() const {
  return *pool_.rlock();
}

bool PoolDriver::waitUntilReady(std::chrono::milliseconds timeout) {
  return initLatch_.await(timeout);
}
}
}
