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

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "arcus/client/ZookeeperClient.h"
#include "arcus/client/detail/SimpleSessionEventWatcher.h"

namespace arcus {
namespace client {

/**
 * Node tree shared by InMemoryZookeeperClient sessions.  Supports just what
 * the coordinator uses: persistent and ephemeral nodes, exists, children
 * with child watches.
 */
class InMemoryZookeeperStore {
 public:
  /**
   * Adds a persistent node along with any missing ancestors.
   */
  void addNode(const std::string& path) {
    std::vector<folly::Promise<NodeEvent>> fired;
    {
      std::lock_guard<std::mutex> g(lock_);
      std::string current;
      size_t pos = 0;
      while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        current = path.substr(0, pos);
        if (nodes_.emplace(current, 0).second) {
          collectChildWatches(parentOf(current), fired);
        }
      }
    }
    fire(fired, WatchEventType::CHILD);
  }

  void removeNode(const std::string& path) {
    std::vector<folly::Promise<NodeEvent>> fired;
    {
      std::lock_guard<std::mutex> g(lock_);
      if (nodes_.erase(path) > 0) {
        collectChildWatches(parentOf(path), fired);
      }
    }
    fire(fired, WatchEventType::CHILD);
  }

  bool hasNode(const std::string& path) const {
    std::lock_guard<std::mutex> g(lock_);
    return nodes_.count(path) > 0;
  }

  std::vector<std::string> getChildren(const std::string& path) const {
    std::lock_guard<std::mutex> g(lock_);
    return childrenOf(path);
  }

  int64_t getEphemeralOwner(const std::string& path) const {
    std::lock_guard<std::mutex> g(lock_);
    auto i = nodes_.find(path);
    return i == nodes_.end() ? 0 : i->second;
  }

  int64_t newSessionId() {
    return ++lastSessionId_;
  }

 private:
  friend class InMemoryZookeeperClient;

  static std::string parentOf(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == 0 ? "/" : path.substr(0, pos);
  }

  std::vector<std::string> childrenOf(const std::string& path) const {
    std::vector<std::string> rval;
    auto prefix = path == "/" ? path : path + "/";
    for (auto i = nodes_.lower_bound(prefix);
         i != nodes_.end() && i->first.compare(0, prefix.size(), prefix) == 0;
         ++i) {
      auto rest = i->first.substr(prefix.size());
      if (!rest.empty() && rest.find('/') == std::string::npos) {
        rval.push_back(rest);
      }
    }
    return rval;
  }

  bool exists(const std::string& path) const {
    return path == "/" || nodes_.count(path) > 0;
  }

  void collectChildWatches(
      const std::string& path,
      std::vector<folly::Promise<NodeEvent>>& out) {
    auto range = childWatches_.equal_range(path);
    for (auto i = range.first; i != range.second; ++i) {
      out.push_back(std::move(i->second.second));
    }
    childWatches_.erase(range.first, range.second);
  }

  void collectSessionWatches(
      int64_t sessionId,
      std::vector<folly::Promise<NodeEvent>>& out) {
    for (auto i = childWatches_.begin(); i != childWatches_.end();) {
      if (i->second.first == sessionId) {
        out.push_back(std::move(i->second.second));
        i = childWatches_.erase(i);
      } else {
        ++i;
      }
    }
  }

  // removes the session's ephemeral nodes, collecting the watches it fires
  void removeEphemerals(
      int64_t sessionId,
      std::vector<folly::Promise<NodeEvent>>& out) {
    for (auto i = nodes_.begin(); i != nodes_.end();) {
      if (i->second == sessionId) {
        auto parent = parentOf(i->first);
        i = nodes_.erase(i);
        collectChildWatches(parent, out);
      } else {
        ++i;
      }
    }
  }

  static void fire(
      std::vector<folly::Promise<NodeEvent>>& promises,
      WatchEventType type) {
    for (auto& p : promises) {
      p.setValue(NodeEvent{0, "", type, SessionState::CONNECTED});
    }
  }

  mutable std::mutex lock_;
  // path -> ephemeral owner, 0 for persistent nodes
  std::map<std::string, int64_t> nodes_;
  std::multimap<std::string, std::pair<int64_t, folly::Promise<NodeEvent>>>
      childWatches_;
  std::atomic<int64_t> lastSessionId_{0};
};

/**
 * One session against an InMemoryZookeeperStore.  Starts out CONNECTING;
 * tests drive it with connect(), disconnect() and expire().
 */
class InMemoryZookeeperClient : public virtual IZookeeperClient,
                                public detail::SimpleSessionEventWatcher {
 public:
  explicit InMemoryZookeeperClient(
      std::shared_ptr<InMemoryZookeeperStore> store)
      : store_(std::move(store)), sessionId_(store_->newSessionId()) {}

  void connect() {
    setState(SessionState::CONNECTED);
  }

  void disconnect() {
    setState(SessionState::CONNECTING);
  }

  void expire() {
    std::vector<folly::Promise<NodeEvent>> fired;
    {
      std::lock_guard<std::mutex> g(store_->lock_);
      store_->removeEphemerals(sessionId_, fired);
    }
    InMemoryZookeeperStore::fire(fired, WatchEventType::CHILD);
    setState(SessionState::EXPIRED);
  }

  bool isClosed() const {
    return closed_;
  }

  SessionState getState() const override {
    return state_;
  }

  int64_t getSessionID() const override {
    return sessionId_;
  }

  std::chrono::milliseconds getSessionTimeout() const override {
    return std::chrono::milliseconds(15000);
  }

  void close() override {
    if (closed_.exchange(true)) {
      return;
    }
    std::vector<folly::Promise<NodeEvent>> ephemeralWatches;
    std::vector<folly::Promise<NodeEvent>> ownWatches;
    {
      std::lock_guard<std::mutex> g(store_->lock_);
      store_->collectSessionWatches(sessionId_, ownWatches);
      store_->removeEphemerals(sessionId_, ephemeralWatches);
    }
    InMemoryZookeeperStore::fire(ownWatches, WatchEventType::CLOSING);
    InMemoryZookeeperStore::fire(ephemeralWatches, WatchEventType::CHILD);
  }

  folly::Future<GetChildrenResult> getChildren(
      const std::string& path) override {
    if (auto ew = checkUsable()) {
      return folly::makeFuture<GetChildrenResult>(std::move(ew));
    }
    std::lock_guard<std::mutex> g(store_->lock_);
    if (!store_->exists(path)) {
      return folly::makeFuture<GetChildrenResult>(
          ZookeeperNoNodeException(std::string(path)));
    }
    return folly::makeFuture(
        GetChildrenResult{store_->childrenOf(path), Stat()});
  }

  ChildrenWithWatch getChildrenWithWatch(const std::string& path) override {
    if (auto ew = checkUsable()) {
      return ChildrenWithWatch{
          folly::makeFuture<GetChildrenResult>(std::move(ew)),
          folly::makeFuture(NodeEvent{
              0, path, WatchEventType::CLOSING, SessionState::DISCONNECTED})};
    }
    std::lock_guard<std::mutex> g(store_->lock_);
    if (!store_->exists(path)) {
      return ChildrenWithWatch{
          folly::makeFuture<GetChildrenResult>(
              ZookeeperNoNodeException(std::string(path))),
          folly::Promise<NodeEvent>().getFuture()};
    }
    folly::Promise<NodeEvent> watch;
    auto watchFuture = watch.getFuture();
    store_->childWatches_.emplace(
        path, std::make_pair(sessionId_, std::move(watch)));
    return ChildrenWithWatch{
        folly::makeFuture(GetChildrenResult{store_->childrenOf(path), Stat()}),
        std::move(watchFuture)};
  }

  folly::Future<folly::Optional<Stat>> exists(
      const std::string& path) override {
    if (auto ew = checkUsable()) {
      return folly::makeFuture<folly::Optional<Stat>>(std::move(ew));
    }
    std::lock_guard<std::mutex> g(store_->lock_);
    auto i = store_->nodes_.find(path);
    if (i == store_->nodes_.end()) {
      return folly::makeFuture(folly::Optional<Stat>());
    }
    Stat s = Stat();
    s.ephemeralOwner = i->second;
    return folly::makeFuture(folly::Optional<Stat>(s));
  }

 protected:
  folly::Future<CreateResult> createNodeInternal(
      const std::string& path,
      const std::string&,
      CreateMode createMode) override {
    if (auto ew = checkUsable()) {
      return folly::makeFuture<CreateResult>(std::move(ew));
    }
    std::vector<folly::Promise<NodeEvent>> fired;
    {
      std::lock_guard<std::mutex> g(store_->lock_);
      if (store_->nodes_.count(path)) {
        return folly::makeFuture<CreateResult>(
            ZookeeperNodeExistsException(std::string(path)));
      }
      auto parent = InMemoryZookeeperStore::parentOf(path);
      if (!store_->exists(parent)) {
        return folly::makeFuture<CreateResult>(
            ZookeeperNoNodeException(std::move(parent)));
      }
      store_->nodes_.emplace(path, createMode.isEphemeral ? sessionId_ : 0);
      store_->collectChildWatches(parent, fired);
    }
    InMemoryZookeeperStore::fire(fired, WatchEventType::CHILD);
    return folly::makeFuture(CreateResult{path});
  }

 private:
  void setState(SessionState state) {
    state_ = state;
    onSessionEvent(state);
  }

  folly::exception_wrapper checkUsable() const {
    if (closed_) {
      return folly::make_exception_wrapper<ZookeeperClosingException>();
    }
    switch (state_.load()) {
      case SessionState::CONNECTED:
        return folly::exception_wrapper();
      case SessionState::EXPIRED:
        return folly::make_exception_wrapper<
            ZookeeperSessionExpiredException>();
      default:
        return folly::make_exception_wrapper<
            ZookeeperConnectionLossException>();
    }
  }

  std::shared_ptr<InMemoryZookeeperStore> store_;
  const int64_t sessionId_;
  std::atomic<SessionState> state_{SessionState::CONNECTING};
  std::atomic<bool> closed_{false};
};

/**
 * SessionFactory handing out InMemoryZookeeperClient sessions on one store
 * and keeping them for inspection.  connectPolicy decides, by creation
 * order, whether a new session connects right away or stays CONNECTING.
 */
class InMemorySessionRecorder {
 public:
  explicit InMemorySessionRecorder(
      std::shared_ptr<InMemoryZookeeperStore> store)
      : store_(std::move(store)) {}

  SessionFactory factory() {
    return [this](const std::string&, std::chrono::milliseconds)
               -> std::shared_ptr<IZookeeperClient> {
      auto session = std::make_shared<InMemoryZookeeperClient>(store_);
      std::unique_lock<std::mutex> g(lock_);
      auto n = sessions_.size();
      sessions_.push_back(session);
      created_.push_back(std::chrono::steady_clock::now());
      g.unlock();
      if (connectPolicy(n)) {
        session->connect();
      }
      return session;
    };
  }

  size_t numSessions() const {
    std::lock_guard<std::mutex> g(lock_);
    return sessions_.size();
  }

  std::shared_ptr<InMemoryZookeeperClient> getSession(size_t i) const {
    std::lock_guard<std::mutex> g(lock_);
    return sessions_.at(i);
  }

  std::chrono::steady_clock::time_point getCreationTime(size_t i) const {
    std::lock_guard<std::mutex> g(lock_);
    return created_.at(i);
  }

  std::function<bool(size_t)> connectPolicy = [](size_t) { return true; };

 private:
  std::shared_ptr<InMemoryZookeeperStore> store_;
  mutable std::mutex lock_;
  std::vector<std::shared_ptr<InMemoryZookeeperClient>> sessions_;
  std::vector<std::chrono::steady_clock::time_point> created_;
};

/**
 * Polls until the predicate holds or the timeout passes.
 */
template <class Predicate>
bool waitFor(
    Predicate p,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!p()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}
}
}
