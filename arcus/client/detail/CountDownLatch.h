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

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace arcus {
namespace client {
namespace detail {

/**
 * Lets threads wait until a fixed number of countDown() calls has been made.
 * The count cannot be reset or raised.
 */
class CountDownLatch {
 public:
  explicit CountDownLatch(size_t count);

  void countDown();

  size_t getCount() const;

  /**
   * Waits until the count reaches zero or the timeout elapses.
   *
   * @return true if the count reached zero
   */
  bool await(std::chrono::milliseconds timeout);

  void await();

 private:
  mutable std::mutex lock_;
  std::condition_variable cond_;
  size_t count_;
};
}
}
}
