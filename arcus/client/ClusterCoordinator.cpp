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

#include "arcus/client/ClusterCoordinator.h"
#include <glog/logging.h>

namespace arcus {
namespace client {

ClusterCoordinator::ClusterCoordinator(
    const CoordinatorConfig& config,
    std::shared_ptr<ICacheClientFactory> cacheClientFactory,
    SessionFactory sessionFactory,
    std::shared_ptr<IConnectionObserver> observer,
    LocalHostResolver localHostResolver)
    : config_(config),
      poolDriver_(std::make_shared<PoolDriver>(
          config,
          std::move(cacheClientFactory),
          std::move(observer))) {
  auto poolDriver = poolDriver_;
  supervisor_ = std::make_unique<SessionSupervisor>(
      config,
      std::move(sessionFactory),
      [poolDriver](ClusterMode mode, std::vector<std::string> children) {
        poolDriver->onNodeListChanged(mode, children);
      },
      std::move(localHostResolver));
  supervisor_->start();
  LOG(INFO) << "Arcus coordinator started. serviceCode="
            << config_.getServiceCode() << ", poolSize="
            << config_.getPoolSize();
}

ClusterCoordinator::~ClusterCoordinator() {
  shutdown();
}

void ClusterCoordinator::shutdown() {
  supervisor_->shutdown();
}
}
}
