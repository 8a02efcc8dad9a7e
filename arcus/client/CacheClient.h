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

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "arcus/client/ClusterPaths.h"

namespace arcus {
namespace client {

/**
 * Connect and disconnect notifications from a cache client.  Called on the
 * client's own event-processing thread.
 */
class IConnectionObserver {
 public:
  virtual ~IConnectionObserver() = default;

  virtual void connectionEstablished(
      const std::string& endpoint,
      int reconnectCount) = 0;

  virtual void connectionLost(const std::string& endpoint) = 0;
};

/**
 * One cache client of the pool.  The client runs its own event loop and
 * reconciles its connections against pushed address lists: endpoints no
 * longer listed are dropped, new ones connected.
 */
class ICacheClient {
 public:
  virtual ~ICacheClient() = default;

  /**
   * Queues a comma-joined endpoint list for the client's event loop.
   */
  virtual void pushAddressUpdate(const std::string& addresses) = 0;

  virtual void wakeEventLoop() = 0;
};

class CacheClientIOException : public std::runtime_error {
 public:
  explicit CacheClientIOException(const std::string& what)
      : std::runtime_error(what) {}
};

class ICacheClientFactory {
 public:
  virtual ~ICacheClientFactory() = default;

  /**
   * Creates a client connecting to the given endpoints.  Throws
   * CacheClientIOException if the client cannot be set up.
   */
  virtual std::unique_ptr<ICacheClient> create(
      ClusterMode mode,
      const std::string& name,
      const std::vector<std::string>& endpoints,
      std::shared_ptr<IConnectionObserver> observer) = 0;
};
}
}
