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

#include <folly/Optional.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace arcus {
namespace client {
namespace detail {

/**
 * An unbounded blocking queue of elements of type E.
 *
 * This class is thread safe.
 */
template <class E>
class BlockingQueue {
 public:
  /**
   * Adds the element and wakes one waiting taker.
   */
  void put(E e) {
    std::unique_lock<std::mutex> g(lock_);
    queue_.push_back(std::move(e));
    g.unlock();
    cond_.notify_one();
  }

  /**
   * Retrieves and removes the head of the queue, waiting forever if the
   * queue is empty.
   */
  E take() {
    std::unique_lock<std::mutex> g(lock_);
    cond_.wait(g, [this] { return !queue_.empty(); });
    return popFront();
  }

  /**
   * Retrieves and removes the head of the queue, waiting up to the timeout
   * for an element to arrive.
   *
   * @return the element, or folly::none if the wait timed out
   */
  folly::Optional<E> take(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> g(lock_);
    if (!cond_.wait_for(g, timeout, [this] { return !queue_.empty(); })) {
      return folly::none;
    }
    return popFront();
  }

  size_t size() const {
    std::unique_lock<std::mutex> g(lock_);
    return queue_.size();
  }

  bool empty() const {
    std::unique_lock<std::mutex> g(lock_);
    return queue_.empty();
  }

 private:
  E popFront() {
    E e = std::move(queue_.front());
    queue_.pop_front();
    return e;
  }

  std::deque<E> queue_;
  mutable std::mutex lock_;
  std::condition_variable cond_;
};
}
}
}
