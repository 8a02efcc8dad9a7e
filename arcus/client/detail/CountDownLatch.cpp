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

#include "arcus/client/detail/CountDownLatch.h"

namespace arcus {
namespace client {
namespace detail {

CountDownLatch::CountDownLatch(size_t count) : count_(count) {}

void CountDownLatch::countDown() {
  std::unique_lock<std::mutex> g(lock_);
  if (count_ == 0) {
    return;
  }
  if (--count_ == 0) {
    g.unlock();
    cond_.notify_all();
  }
}

size_t CountDownLatch::getCount() const {
  std::unique_lock<std::mutex> g(lock_);
  return count_;
}

bool CountDownLatch::await(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> g(lock_);
  return cond_.wait_for(g, timeout, [this] { return count_ == 0; });
}

void CountDownLatch::await() {
  std::unique_lock<std::mutex> g(lock_);
  cond_.wait(g, [this] { return count_ == 0; });
}
}
}
}
