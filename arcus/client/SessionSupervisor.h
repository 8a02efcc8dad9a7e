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
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "arcus/client/ClusterPaths.h"
#include "arcus/client/CoordinatorConfig.h"
#include "arcus/client/LocalHost.h"
#include "arcus/client/MembershipWatcher.h"
#include "arcus/client/ZookeeperClient.h"
#include "arcus/client/detail/BlockingQueue.h"

namespace arcus {
namespace client {

enum class LifecycleState {
  NO_SESSION,
  CONNECTING,
  CONNECTED,
  /**
   * Terminal.
   */
  SHUTTING_DOWN,
};

std::string toString(LifecycleState state);

/**
 * Owns the coordination-store session of a coordinator.  An attempt creates
 * a session, waits for it to connect, determines the cluster mode, registers
 * this client's presence record and installs the membership watcher.  After
 * the first attempt a worker thread replaces the session whenever the
 * watcher reports it dead, retrying failed attempts after a fixed delay.
 */
class SessionSupervisor {
 public:
  /**
   * Receives every child list of the membership path, on a session
   * callback thread.
   */
  using MembershipListener =
      folly::Function<void(ClusterMode, std::vector<std::string>)>;

  SessionSupervisor(
      const CoordinatorConfig& config,
      SessionFactory sessionFactory,
      MembershipListener listener,
      LocalHostResolver localHostResolver = resolveLocalHost);

  ~SessionSupervisor();

  /**
   * Runs the first attempt on the calling thread, then starts the retry
   * worker.  Throws AdminConnectTimeoutException, ServiceNotFoundException
   * or InitializationException if the first attempt fails; no worker is
   * started in that case.
   */
  void start();

  /**
   * Stops the retry worker and closes the session.  An attempt in progress
   * on another thread finishes on its own and its session is closed.
   * Idempotent.
   */
  void shutdown();

  LifecycleState getState() const {
    return state_;
  }

  folly::Optional<ClusterMode> getClusterMode() const;

  std::shared_ptr<IZookeeperClient> getSession() const;

 private:
  enum class SupervisorEvent {
    SESSION_DEAD,
    SHUTDOWN,
  };

  void run();
  void establishSession();
  ClusterMode probeClusterMode(IZookeeperClient& session);
  void registerPresence(
      const std::shared_ptr<IZookeeperClient>& session,
      ClusterMode mode);
  void closeSession();
  static void closeQuietly(IZookeeperClient& session);
  bool waitRetryDelay();
  void setState(LifecycleState state);

  const CoordinatorConfig config_;
  SessionFactory sessionFactory_;
  MembershipListener listener_;
  LocalHostResolver localHostResolver_;

  std::atomic<LifecycleState> state_;
  std::atomic<bool> started_{false};
  std::atomic<bool> shutdownRequested_{false};

  mutable std::mutex sessionLock_;
  std::shared_ptr<IZookeeperClient> session_;
  std::shared_ptr<MembershipWatcher> watcher_;
  folly::Optional<ClusterMode> mode_;

  detail::BlockingQueue<SupervisorEvent> events_;

  std::mutex workerLock_;
  std::thread worker_;
};
}
}
