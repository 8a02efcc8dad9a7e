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
#include <folly/futures/Future.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "arcus/client/ZookeeperExceptions.h"

namespace arcus {
namespace client {

/**
 * Parameters for node creation.  Ephemeral nodes are deleted by the server
 * when the creating session ends; presence records are always ephemeral.
 */
class CreateMode {
 public:
  explicit CreateMode(bool _isEphemeral = false, bool _isSequential = false)
      : isEphemeral(_isEphemeral), isSequential(_isSequential) {}

  bool isEphemeral : 1;
  bool isSequential : 1;

  inline static CreateMode ephemeral() {
    return CreateMode(true);
  }
};

/**
 * The subset of znode metadata the coordinator looks at.
 */
struct Stat {
  int64_t czxid;
  int64_t mzxid;
  int32_t version;
  int32_t cversion;
  /**
   * If this node is ephemeral, the session ID that created it, else zero.
   */
  int64_t ephemeralOwner;
  int32_t numChildren;
};

/**
 * Possible states of a coordination-store session.  Values match the C
 * client's state constants where one exists.
 */
enum class SessionState {
  DISCONNECTED = 0,
  CONNECTING = 1,
  ASSOCIATING = 2,
  CONNECTED = 3,
  READONLY = 5,
  /**
   * The session is gone along with its ephemeral nodes.  Terminal; a new
   * session has to be created.
   */
  EXPIRED = -112,
  /**
   * Terminal as well.
   */
  AUTH_FAILED = -113,
  TIMED_OUT = 998,
};

enum class WatchEventType {
  CREATED = 1,
  DELETED = 2,
  CHANGED = 3,
  CHILD = 4,
  SESSION = -1,
  /**
   * The server stopped watching the node; the watch has to be set again.
   */
  NOT_WATCHING = -2,
  /**
   * The client is being closed; no further events will come.
   */
  CLOSING,
};

struct SessionEvent {
  size_t eventIndex;
  SessionState state;
};

struct NodeEvent {
  size_t eventIndex;
  std::string path;
  WatchEventType type;
  SessionState state;
};

/**
 * Opaque handle returned by ISessionEventWatcher::addCallback, handed back to
 * deregister the callback.
 */
class IEventWatchCallbackIdentifier {
 public:
  virtual ~IEventWatchCallbackIdentifier() = default;
};

/**
 * Fan-out of session state changes.  Callbacks are implicitly deregistered
 * when the watcher is destroyed.
 */
class ISessionEventWatcher {
 public:
  virtual ~ISessionEventWatcher() = default;

  /**
   * Registers a callback for session state changes.  If a state has already
   * been seen the callback is invoked right away with the most recent one.
   */
  virtual std::unique_ptr<IEventWatchCallbackIdentifier> addCallback(
      folly::Function<void(SessionEvent)>&&) = 0;

  /**
   * Deregisters and returns the callback.  Does not return while a call into
   * that callback is in progress.
   */
  virtual folly::Function<void(SessionEvent)> removeCallback(
      std::unique_ptr<IEventWatchCallbackIdentifier>&&) = 0;

  /**
   * Completes when the session reaches the given state.  Completes
   * immediately if that is the current state.
   */
  virtual folly::Future<SessionEvent> getEventForState(SessionState) = 0;
};

struct CreateResult {
  std::string name;
};

struct GetChildrenResult {
  std::vector<std::string> children;
  Stat parentStat;
};

/**
 * Result of a read that also sets a watch.  The watch future completes once,
 * after the response, as soon as the response is out of date; it completes
 * with a CLOSING event if the client goes away first.
 */
template <class T>
struct WithWatch {
  folly::Future<T> response;
  folly::Future<NodeEvent> watch;
};

using ChildrenWithWatch = WithWatch<GetChildrenResult>;

class UnrecognizedCallbackIdentifierException : public std::runtime_error {
 public:
  UnrecognizedCallbackIdentifierException()
      : std::runtime_error("callback identifier was not recognized") {}
};

/**
 * A session against the coordination store.  One instance is one session;
 * recovering from an expired session means creating a new instance.
 */
class IZookeeperClient : public virtual ISessionEventWatcher {
 public:
  virtual ~IZookeeperClient() {}

  virtual SessionState getState() const = 0;

  virtual int64_t getSessionID() const = 0;

  virtual std::chrono::milliseconds getSessionTimeout() const = 0;

  /**
   * Closes the session.  Ephemeral nodes owned by it disappear.  Calling this
   * more than once is harmless.
   */
  virtual void close() = 0;

  folly::Future<CreateResult> createNode(
      const std::string& path,
      const std::string& data,
      CreateMode createMode = CreateMode()) {
    return createNodeInternal(path, data, createMode);
  }

  virtual folly::Future<GetChildrenResult> getChildren(
      const std::string& path) = 0;
  virtual ChildrenWithWatch getChildrenWithWatch(const std::string& path) = 0;

  /**
   * Completes with the node's Stat, or folly::none if there is no node.
   */
  virtual folly::Future<folly::Optional<Stat>> exists(
      const std::string& path) = 0;

 protected:
  virtual folly::Future<CreateResult> createNodeInternal(
      const std::string& path,
      const std::string& data,
      CreateMode createMode) = 0;
};

/**
 * Creates a session for the given connection string and session timeout.
 * Throws a ZookeeperException if the handle cannot be created.
 */
using SessionFactory = folly::Function<std::shared_ptr<IZookeeperClient>(
    const std::string& connectionString,
    std::chrono::milliseconds sessionTimeout)>;

/**
 * SessionFactory producing sessions backed by the ZooKeeper C client.
 */
SessionFactory makeBasicSessionFactory();

inline std::string toString(SessionState state) {
  switch (state) {
    case SessionState::DISCONNECTED:
      return "DISCONNECTED";
    case SessionState::CONNECTING:
      return "CONNECTING";
    case SessionState::ASSOCIATING:
      return "ASSOCIATING";
    case SessionState::CONNECTED:
      return "CONNECTED";
    case SessionState::READONLY:
      return "READONLY";
    case SessionState::EXPIRED:
      return "EXPIRED";
    case SessionState::AUTH_FAILED:
      return "AUTH_FAILED";
    case SessionState::TIMED_OUT:
      return "TIMED_OUT";
    default:
      return "[unrecognized session state]";
  }
}
}
}

namespace std {
template <>
struct hash<arcus::client::SessionState> {
  size_t operator()(const arcus::client::SessionState& state) const {
    return size_t(state);
  }
};
}
