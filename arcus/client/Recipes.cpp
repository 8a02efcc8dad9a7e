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

#include "arcus/client/Recipes.h"

namespace arcus {
namespace client {

bool connectWithTimeout(
    IZookeeperClient& conn,
    std::chrono::milliseconds timeout) {
  auto f = conn.getEventForState(SessionState::CONNECTED);
  f.wait(timeout);
  return f.isReady() && f.hasValue();
}

folly::Future<bool> claimEphemeralNode(
    const std::shared_ptr<IZookeeperClient>& conn,
    const std::string& path,
    const std::string& data) {
  return conn->createNode(path, data, CreateMode::ephemeral())
      .thenValue([](const CreateResult&) { return true; })
      .thenError(
          folly::tag_t<ZookeeperNodeExistsException>{},
          [conn, path](const ZookeeperNodeExistsException&) {
            return conn->exists(path).thenValue(
                [sid = conn->getSessionID()](folly::Optional<Stat> s) {
                  return s.hasValue() && s.value().ephemeralOwner == sid;
                });
          });
}
}
}
