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

#include <string>
#include <vector>
#include "arcus/client/ClusterPaths.h"

namespace arcus {
namespace client {

using EndpointList = std::vector<std::string>;

/**
 * Turns the children of a membership path into the endpoint list handed to
 * cache clients.  Simple names (ip:port-hostname) are cut at the first '-';
 * replication names pass through whole.  Order and duplicates are kept.
 */
EndpointList translate(
    ClusterMode mode,
    const std::vector<std::string>& rawNames);

/**
 * Comma-joined text form of an endpoint list.
 */
std::string joinEndpoints(const EndpointList& endpoints);
}
}
