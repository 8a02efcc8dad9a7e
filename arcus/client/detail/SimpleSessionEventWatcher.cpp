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

#include "arcus/client/detail/SimpleSessionEventWatcher.h"
#include <glog/logging.h>
#include <shared_mutex>

namespace arcus {
namespace client {
namespace detail {

void SimpleSessionEventWatcher::Callback::call(const SessionEvent& e) {
  std::unique_lock<std::mutex> g(lock_);
  if (f_) {
    try {
      f_(e);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "uncaught exception from session event callback ("
                 << toString(e.state) << "): " << ex.what();
    }
  }
}

folly::Function<void(SessionEvent)>
SimpleSessionEventWatcher::Callback::extract() {
  std::unique_lock<std::mutex> g(lock_);
  auto rval = std::move(f_);
  f_ = nullptr;
  return rval;
}

SimpleSessionEventWatcher::SimpleSessionEventWatcher()
    : nextIndex_(0), lastState_(SessionState::DISCONNECTED) {}

std::unique_ptr<IEventWatchCallbackIdentifier>
SimpleSessionEventWatcher::addCallback(
    folly::Function<void(SessionEvent)>&& callback) {
  auto callbackPtr = std::make_shared<Callback>(std::move(callback));

  std::shared_lock<folly::SharedMutex> sg(stateLock_);
  if (nextIndex_ > 0) {
    callbackPtr->call(SessionEvent{nextIndex_ - 1, lastState_});
  }
  sg.unlock();

  auto rval = std::make_unique<CallbackIdentifier>();
  std::unique_lock<folly::SharedMutex> cg(callbacksLock_);
  callbacks_.push_front(std::move(callbackPtr));
  rval->i_ = callbacks_.begin();
  return std::move(rval);
}

folly::Function<void(SessionEvent)> SimpleSessionEventWatcher::removeCallback(
    std::unique_ptr<IEventWatchCallbackIdentifier>&& i) {
  auto* callbackIdentifier = dynamic_cast<CallbackIdentifier*>(i.get());
  if (!callbackIdentifier) {
    throw UnrecognizedCallbackIdentifierException();
  }
  std::unique_lock<folly::SharedMutex> g(callbacksLock_);
  auto callbackPtr = *callbackIdentifier->i_;
  callbacks_.erase(callbackIdentifier->i_);
  g.unlock();
  // extract() waits for a call in progress on another thread
  return callbackPtr->extract();
}

void SimpleSessionEventWatcher::onSessionEvent(SessionState state) {
  std::unique_lock<folly::SharedMutex> sg(stateLock_);
  auto index = nextIndex_++;
  lastState_ = state;
  sg.unlock();

  SessionEvent e{index, state};

  std::shared_lock<folly::SharedMutex> cg(callbacksLock_);
  auto callbacksCopy = callbacks_;
  cg.unlock();
  for (auto& callback : callbacksCopy) {
    callback->call(e);
  }

  std::unique_lock<std::mutex> pg(promisesLock_);
  auto i = promises_.find(state);
  if (i != promises_.end()) {
    auto promise = std::move(i->second);
    promises_.erase(i);
    pg.unlock();
    promise.setValue(e);
  }
}

folly::Future<SessionEvent> SimpleSessionEventWatcher::getEventForState(
    SessionState state) {
  std::shared_lock<folly::SharedMutex> sg(stateLock_);
  if (nextIndex_ > 0 && lastState_ == state) {
    return folly::makeFuture(SessionEvent{nextIndex_ - 1, state});
  }

  std::unique_lock<std::mutex> pg(promisesLock_);
  return promises_[state].getFuture();
}

size_t SimpleSessionEventWatcher::getNextIndex() const {
  std::shared_lock<folly::SharedMutex> g(stateLock_);
  return nextIndex_;
}

std::pair<size_t, SessionState>
SimpleSessionEventWatcher::getNextIndexAndCurrentState() const {
  std::shared_lock<folly::SharedMutex> g(stateLock_);
  return std::make_pair(nextIndex_, lastState_);
}
}
}
}
