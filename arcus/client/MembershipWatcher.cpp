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

#include "arcus/client/MembershipWatcher.h"
#include <glog/logging.h>

namespace arcus {
namespace client {

MembershipWatcher::MembershipWatcher(
    std::shared_ptr<IZookeeperClient> session,
    const std::string& path,
    NodeListCallback onNodeList,
    DeadCallback onDead)
    : session_(std::move(session)),
      path_(path),
      onNodeList_(std::move(onNodeList)),
      onDead_(std::move(onDead)) {}

void MembershipWatcher::start() {
  std::weak_ptr<MembershipWatcher> weak = shared_from_this();
  auto id = session_->addCallback([weak](SessionEvent e) {
    if (auto self = weak.lock()) {
      self->onSessionEvent(e);
    }
  });
  {
    std::lock_guard<std::mutex> g(lock_);
    sessionCallbackId_ = std::move(id);
  }
  fetch();
}

void MembershipWatcher::stop() {
  std::unique_lock<std::mutex> g(lock_);
  stopped_ = true;
  auto id = std::move(sessionCallbackId_);
  g.unlock();
  if (id) {
    session_->removeCallback(std::move(id));
  }
}

void MembershipWatcher::fetch() {
  if (dead_) {
    return;
  }
  {
    std::lock_guard<std::mutex> g(lock_);
    if (stopped_) {
      return;
    }
  }

  std::weak_ptr<MembershipWatcher> weak = shared_from_this();
  try {
    auto r = session_->getChildrenWithWatch(path_);
    std::move(r.watch).thenValue([weak](NodeEvent e) {
      if (auto self = weak.lock()) {
        self->onWatchEvent(e);
      }
    });
    std::move(r.response).thenTry([weak](folly::Try<GetChildrenResult>&& t) {
      if (auto self = weak.lock()) {
        self->onChildren(std::move(t));
      }
    });
  } catch (const ZookeeperException&) {
    onError(folly::exception_wrapper(std::current_exception()));
  }
}

void MembershipWatcher::onChildren(folly::Try<GetChildrenResult>&& t) {
  if (t.hasException()) {
    onError(t.exception());
  } else {
    deliver(std::move(t.value().children));
  }
}

void MembershipWatcher::onWatchEvent(const NodeEvent& e) {
  switch (e.type) {
    case WatchEventType::CLOSING:
    case WatchEventType::SESSION:
      break;
    default:
      VLOG(1) << "membership watch fired on " << path_
              << ", type=" << static_cast<int>(e.type);
      fetch();
      break;
  }
}

void MembershipWatcher::onSessionEvent(const SessionEvent& e) {
  switch (e.state) {
    case SessionState::EXPIRED:
      markDead("session expired");
      break;
    case SessionState::AUTH_FAILED:
      markDead("authentication failed");
      break;
    case SessionState::CONNECTED:
      if (refetchOnConnect_.exchange(false)) {
        fetch();
      }
      break;
    default:
      break;
  }
}

void MembershipWatcher::onError(const folly::exception_wrapper& ew) {
  if (ew.is_compatible_with<ZookeeperSessionExpiredException>() ||
      ew.is_compatible_with<ZookeeperAuthFailedException>()) {
    markDead(ew.what().toStdString());
  } else if (ew.is_compatible_with<ZookeeperClosingException>()) {
    // the session was closed under us; nothing more will arrive
    markDead(ew.what().toStdString());
  } else if (ew.is_compatible_with<ZookeeperNetworkException>()) {
    LOG(WARNING) << "can't read " << path_ << ", retrying on reconnect: "
                 << ew.what();
    refetchOnReconnect();
  } else if (ew.is_compatible_with<ZookeeperNoNodeException>()) {
    LOG(ERROR) << "membership path " << path_
               << " does not exist, retrying on reconnect";
    refetchOnReconnect();
  } else {
    LOG(ERROR) << "error reading " << path_ << ": " << ew.what();
    refetchOnReconnect();
  }
}

void MembershipWatcher::refetchOnReconnect() {
  refetchOnConnect_ = true;
}

void MembershipWatcher::deliver(std::vector<std::string>&& children) {
  std::lock_guard<std::mutex> g(lock_);
  if (stopped_ || dead_) {
    return;
  }
  if (lastDelivered_.hasValue() && lastDelivered_.value() == children) {
    return;
  }
  lastDelivered_ = children;
  try {
    onNodeList_(std::move(children));
  } catch (const std::exception& e) {
    LOG(ERROR) << "membership callback for " << path_
               << " threw: " << e.what();
  }
}

void MembershipWatcher::markDead(const std::string& reason) {
  if (dead_.exchange(true)) {
    return;
  }
  LOG(WARNING) << "membership watcher on " << path_ << " is dead: " << reason;
  std::lock_guard<std::mutex> g(lock_);
  if (!stopped_) {
    onDead_();
  }
}
}
}
