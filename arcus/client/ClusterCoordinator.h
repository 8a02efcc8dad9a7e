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

#pragma once

#include <chrono>
#include <memory>
#include "arcus/client/CacheClient.h"
#include "arcus/client/CoordinatorConfig.h"
#include "arcus/client/CoordinatorExceptions.h"
#include "arcus/client/PoolDriver.h"
#include "arcus/client/SessionSupervisor.h"

namespace arcus {
namespace client {

/**
 * Keeps a pool of cache clients connected to the live members of an Arcus
 * cache cluster.
 *
 * Construction connects to the admin ensemble and registers this client;
 * it throws AdminConnectTimeoutException, ServiceNotFoundException or
 * InitializationException if that fails.  From then on failures are logged
 * and the session is re-established in the background until shutdown().
 */
class ClusterCoordinator {
 public:
  ClusterCoordinator(
      const CoordinatorConfig& config,
      std::shared_ptr<ICacheClientFactory> cacheClientFactory,
      SessionFactory sessionFactory = makeBasicSessionFactory(),
      std::shared_ptr<IConnectionObserver> observer = nullptr,
      LocalHostResolver localHostResolver = resolveLocalHost);

  ~ClusterCoordinator();

  ClusterCoordinator(const ClusterCoordinator&) = delete;
  ClusterCoordinator& operator=(const ClusterCoordinator&) = delete;

  /**
   * Current pool snapshot; nullptr until the first membership list arrives.
   */
  std::shared_ptr<const ClientPool> getPool() const {
    return poolDriver_->getPool();
  }

  /**
   * Waits until the pool has been built.
   */
  bool waitUntilReady(std::chrono::milliseconds timeout) {
    return poolDriver_->waitUntilReady(timeout);
  }

  LifecycleState getState() const {
    return supervisor_->getState();
  }

  folly::Optional<ClusterMode> getClusterMode() const {
    return supervisor_->getClusterMode();
  }

  const CoordinatorConfig& getConfig() const {
    return config_;
  }

  void shutdown();

 private:
  const CoordinatorConfig config_;
  std::shared_ptr<PoolDriver> poolDriver_;
  std::unique_ptr<SessionSupervisor> supervisor_;
};
}
}
