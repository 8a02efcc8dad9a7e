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

#include <folly/Function.h>
#include <folly/Optional.h>
#include <folly/Try.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "arcus/client/ZookeeperClient.h"

namespace arcus {
namespace client {

/**
 * Keeps a children watch set on one membership path and reports every new
 * child list.  Once the session is found expired (or its authentication
 * failed) the watcher declares itself dead; the session has to be replaced.
 *
 * Callbacks run on the session's callback threads, one at a time, and never
 * after stop() has returned.
 */
class MembershipWatcher
    : public std::enable_shared_from_this<MembershipWatcher> {
 public:
  using NodeListCallback = folly::Function<void(std::vector<std::string>)>;
  using DeadCallback = folly::Function<void()>;

  MembershipWatcher(
      std::shared_ptr<IZookeeperClient> session,
      const std::string& path,
      NodeListCallback onNodeList,
      DeadCallback onDead);

  /**
   * Subscribes to session events and issues the first read.  Must be called
   * once, on an instance owned by a shared_ptr.
   */
  void start();

  void stop();

  bool isDead() const {
    return dead_;
  }

  const std::string& getPath() const {
    return path_;
  }

 private:
  void fetch();
  void onChildren(folly::Try<GetChildrenResult>&& t);
  void onWatchEvent(const NodeEvent& e);
  void onSessionEvent(const SessionEvent& e);
  void onError(const folly::exception_wrapper& ew);
  void refetchOnReconnect();
  void deliver(std::vector<std::string>&& children);
  void markDead(const std::string& reason);

  std::shared_ptr<IZookeeperClient> session_;
  const std::string path_;

  std::atomic<bool> dead_{false};
  std::atomic<bool> refetchOnConnect_{false};

  // guards the callbacks and everything below
  std::mutex lock_;
  NodeListCallback onNodeList_;
  DeadCallback onDead_;
  bool stopped_{false};
  folly::Optional<std::vector<std::string>> lastDelivered_;
  std::unique_ptr<IEventWatchCallbackIdentifier> sessionCallbackId_;
};
}
}
