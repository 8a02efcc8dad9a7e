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

#include <folly/Synchronized.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "arcus/client/AddressTranslator.h"
#include "arcus/client/CacheClient.h"
#include "arcus/client/CoordinatorConfig.h"
#include "arcus/client/detail/CountDownLatch.h"

namespace arcus {
namespace client {

/**
 * Slots of the cache client pool.  A slot whose client could not be created
 * is nullptr for the life of the pool.
 */
using ClientPool = std::vector<std::shared_ptr<ICacheClient>>;

/**
 * Owns the pool of cache clients and feeds it membership changes.  The
 * first non-empty endpoint list builds the pool; every later one is pushed
 * to the existing clients.
 */
class PoolDriver {
 public:
  static constexpr std::chrono::milliseconds kConnectWaitPerEndpoint{50};

  PoolDriver(
      const CoordinatorConfig& config,
      std::shared_ptr<ICacheClientFactory> factory,
      std::shared_ptr<IConnectionObserver> userObserver = nullptr);

  /**
   * Entry point for the membership watcher.  Translates the raw node names
   * and builds or updates the pool.  An empty list is ignored.
   */
  void onNodeListChanged(
      ClusterMode mode,
      const std::vector<std::string>& rawNames);

  /**
   * Creates poolSize clients against the addresses, then waits a bounded
   * time for the real endpoints to connect.  Running out of time is logged,
   * not reported.  Called on a driver that already has a pool, it behaves
   * like updateAddresses().
   */
  void buildInitial(ClusterMode mode, const EndpointList& addresses);

  /**
   * Pushes the addresses to every live client and wakes its event loop.
   * Builds the pool first if there is none yet.
   */
  void updateAddresses(ClusterMode mode, const EndpointList& addresses);

  /**
   * Current pool, or nullptr before the first build.
   */
  std::shared_ptr<const ClientPool> getPool() const;

  /**
   * Waits for the first build to finish.
   *
   * @return true if the pool was built within the timeout
   */
  bool waitUntilReady(std::chrono::milliseconds timeout);

  /**
   * How long a build waits for connections: the configured wait if positive,
   * otherwise 50ms for every real endpoint.
   */
  static std::chrono::milliseconds getConnectBudget(
      std::chrono::milliseconds configured,
      size_t realEndpoints);

 private:
  class StartupObserver;

  void pushAddresses(const ClientPool& pool, const EndpointList& addresses);

  const CoordinatorConfig config_;
  std::shared_ptr<ICacheClientFactory> factory_;
  std::shared_ptr<IConnectionObserver> userObserver_;

  std::mutex buildLock_;
  folly::Synchronized<std::shared_ptr<const ClientPool>> pool_;
  detail::CountDownLatch initLatch_;
};
}
}
