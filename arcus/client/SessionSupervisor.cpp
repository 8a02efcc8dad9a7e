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

#include "arcus/client/SessionSupervisor.h"
#include <folly/Conv.h>
#include <glog/logging.h>
#include <ctime>
#include <ios>
#include "arcus/client/CoordinatorExceptions.h"
#include "arcus/client/Recipes.h"
#include "arcus/client/Version.h"

namespace arcus {
namespace client {

std::string toString(LifecycleState state) {
  switch (state) {
    case LifecycleState::NO_SESSION:
      return "NO_SESSION";
    case LifecycleState::CONNECTING:
      return "CONNECTING";
    case LifecycleState::CONNECTED:
      return "CONNECTED";
    case LifecycleState::SHUTTING_DOWN:
      return "SHUTTING_DOWN";
    default:
      return "[unrecognized lifecycle state]";
  }
}

SessionSupervisor::SessionSupervisor(
    const CoordinatorConfig& config,
    SessionFactory sessionFactory,
    MembershipListener listener,
    LocalHostResolver localHostResolver)
    : config_(config),
      sessionFactory_(std::move(sessionFactory)),
      listener_(std::move(listener)),
      localHostResolver_(std::move(localHostResolver)),
      state_(LifecycleState::NO_SESSION) {}

SessionSupervisor::~SessionSupervisor() {
  shutdown();
}

void SessionSupervisor::start() {
  if (started_.exchange(true)) {
    throw std::logic_error("session supervisor already started");
  }
  if (shutdownRequested_) {
    return;
  }

  try {
    establishSession();
  } catch (const CoordinatorException&) {
    setState(LifecycleState::NO_SESSION);
    throw;
  }

  std::unique_lock<std::mutex> g(workerLock_);
  if (shutdownRequested_) {
    g.unlock();
    closeSession();
    return;
  }
  worker_ = std::thread([this] { run(); });
}

void SessionSupervisor::shutdown() {
  std::unique_lock<std::mutex> g(workerLock_);
  if (shutdownRequested_.exchange(true)) {
    return;
  }
  state_ = LifecycleState::SHUTTING_DOWN;
  auto worker = std::move(worker_);
  g.unlock();

  LOG(INFO) << "shutting down session supervisor. serviceCode="
            << config_.getServiceCode();
  events_.put(SupervisorEvent::SHUTDOWN);
  if (worker.joinable()) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  closeSession();
}

folly::Optional<ClusterMode> SessionSupervisor::getClusterMode() const {
  std::lock_guard<std::mutex> g(sessionLock_);
  return mode_;
}

std::shared_ptr<IZookeeperClient> SessionSupervisor::getSession() const {
  std::lock_guard<std::mutex> g(sessionLock_);
  return session_;
}

void SessionSupervisor::run() {
  while (!shutdownRequested_) {
    if (getSession()) {
      auto event = events_.take();
      if (event == SupervisorEvent::SHUTDOWN) {
        break;
      }
      std::shared_ptr<MembershipWatcher> watcher;
      {
        std::lock_guard<std::mutex> g(sessionLock_);
        watcher = watcher_;
      }
      if (!watcher || !watcher->isDead()) {
        continue;
      }
      LOG(WARNING) << "Arcus admin session is dead, reconnecting. serviceCode="
                   << config_.getServiceCode();
      closeSession();
      setState(LifecycleState::NO_SESSION);
      if (shutdownRequested_) {
        break;
      }
    }

    try {
      establishSession();
    } catch (const CoordinatorException& e) {
      LOG(ERROR) << "Arcus admin connection failed, retrying in "
                 << config_.getRetryDelay().count()
                 << "ms. serviceCode=" << config_.getServiceCode() << ": "
                 << e.what();
      setState(LifecycleState::NO_SESSION);
      if (!waitRetryDelay()) {
        break;
      }
    }
  }
  closeSession();
}

bool SessionSupervisor::waitRetryDelay() {
  auto deadline = std::chrono::steady_clock::now() + config_.getRetryDelay();
  while (!shutdownRequested_) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    auto event = events_.take(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
        std::chrono::milliseconds(1));
    if (event.hasValue() && event.value() == SupervisorEvent::SHUTDOWN) {
      return false;
    }
    // a SESSION_DEAD seen here belongs to a session already replaced
  }
  return false;
}

void SessionSupervisor::establishSession() {
  setState(LifecycleState::CONNECTING);

  std::shared_ptr<IZookeeperClient> session;
  try {
    session =
        sessionFactory_(config_.getAdminAddress(), config_.getSessionTimeout());
  } catch (const ZookeeperException& e) {
    throw InitializationException(
        folly::to<std::string>("can't create admin session: ", e.what()));
  }
  if (!session) {
    throw InitializationException("can't create admin session");
  }

  if (!connectWithTimeout(*session, config_.getConnectTimeout())) {
    closeQuietly(*session);
    throw AdminConnectTimeoutException(config_.getAdminAddress());
  }
  LOG(INFO) << "Connected to Arcus admin. (" << config_.getServiceCode() << "@"
            << config_.getAdminAddress() << ")";

  ClusterMode mode;
  try {
    mode = probeClusterMode(*session);
    registerPresence(session, mode);
  } catch (const CoordinatorException&) {
    closeQuietly(*session);
    throw;
  } catch (const ZookeeperException& e) {
    closeQuietly(*session);
    throw InitializationException(e.what());
  } catch (const folly::FutureTimeout& e) {
    closeQuietly(*session);
    throw InitializationException(e.what());
  }

  std::unique_lock<std::mutex> g(sessionLock_);
  if (shutdownRequested_) {
    g.unlock();
    LOG(INFO) << "shutdown requested, dropping new admin session";
    closeQuietly(*session);
    return;
  }
  mode_ = mode;
  session_ = session;
  watcher_ = std::make_shared<MembershipWatcher>(
      session,
      paths::getMembershipPath(mode, config_.getServiceCode()),
      [this, mode](std::vector<std::string> children) {
        listener_(mode, std::move(children));
      },
      [this] { events_.put(SupervisorEvent::SESSION_DEAD); });
  auto watcher = watcher_;
  g.unlock();

  setState(LifecycleState::CONNECTED);
  watcher->start();
}

ClusterMode SessionSupervisor::probeClusterMode(IZookeeperClient& session) {
  auto known = getClusterMode();
  const auto& serviceCode = config_.getServiceCode();
  auto timeout = config_.getSessionTimeout();

  if (known.hasValue()) {
    auto path = paths::getMembershipPath(known.value(), serviceCode);
    if (!session.exists(path).get(timeout).hasValue()) {
      throw ServiceNotFoundException(serviceCode);
    }
    return known.value();
  }

  for (auto mode : {ClusterMode::REPLICATION, ClusterMode::SIMPLE}) {
    auto path = paths::getMembershipPath(mode, serviceCode);
    if (session.exists(path).get(timeout).hasValue()) {
      LOG(INFO) << "Arcus cluster mode of " << serviceCode << " is "
                << toString(mode);
      return mode;
    }
  }
  throw ServiceNotFoundException(serviceCode);
}

void SessionSupervisor::registerPresence(
    const std::shared_ptr<IZookeeperClient>& session,
    ClusterMode mode) {
  LocalHost host;
  try {
    host = localHostResolver_();
  } catch (const std::runtime_error& e) {
    throw InitializationException(e.what());
  }

  PresenceRecord record{host.hostname,
                        host.ipAddress,
                        config_.getPoolSize(),
                        config_.getClientLangTag(),
                        ARCUS_CLIENT_VERSION,
                        std::time(nullptr),
                        session->getSessionID()};
  auto path =
      paths::getPresenceRecordPath(mode, config_.getServiceCode(), record);

  if (claimEphemeralNode(session, path).get(config_.getSessionTimeout())) {
    LOG(INFO) << "registered client presence at " << path;
  } else {
    LOG(WARNING) << "client presence " << path
                 << " already exists under another session";
  }
}

void SessionSupervisor::closeSession() {
  std::unique_lock<std::mutex> g(sessionLock_);
  auto session = std::move(session_);
  auto watcher = std::move(watcher_);
  g.unlock();

  if (watcher) {
    watcher->stop();
  }
  if (session) {
    LOG(INFO) << "Close the ZooKeeper client. serviceCode="
              << config_.getServiceCode() << ", adminSessionId=0x" << std::hex
              << session->getSessionID() << std::dec;
    closeQuietly(*session);
  }
}

void SessionSupervisor::closeQuietly(IZookeeperClient& session) {
  try {
    session.close();
  } catch (const ZookeeperException& e) {
    LOG(ERROR) << "error closing admin session: " << e.what();
  }
}

void SessionSupervisor::setState(LifecycleState state) {
  auto current = state_.load();
  while (current != LifecycleState::SHUTTING_DOWN) {
    if (state_.compare_exchange_weak(current, state)) {
      if (current != state) {
        VLOG(1) << "lifecycle " << toString(current) << " -> "
                << toString(state);
      }
      return;
    }
  }
}
}
}
