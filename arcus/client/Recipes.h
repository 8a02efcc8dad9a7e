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
#include "arcus/client/ZookeeperClient.h"

namespace arcus {
namespace client {

/**
 * Blocks until the session reports CONNECTED or the timeout passes.
 *
 * @return true if the session connected in time
 */
bool connectWithTimeout(
    IZookeeperClient& conn,
    std::chrono::milliseconds timeout);

/**
 * Creates an ephemeral node at the given path.  If the node already exists
 * the result is true when this session owns it and false otherwise; it is
 * never created twice.  Other errors are passed through.
 */
folly::Future<bool> claimEphemeralNode(
    const std::shared_ptr<IZookeeperClient>& conn,
    const std::string& path,
    const std::string& data = "");
}
}
