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

#include <cstdint>
#include <string>
#include <vector>
#include "arcus/client/ClusterPaths.h"

namespace arcus {
namespace client {

/**
 * Address the replication cluster publishes for a group with no eligible
 * member.
 */
constexpr const char* kFakeEndpointHost = "0.0.0.0";
constexpr uint16_t kFakeEndpointPort = 23456;

enum class EndpointRole {
  NONE,
  MASTER,
  SLAVE,
};

struct Endpoint {
  /**
   * Replication group, empty in simple mode.
   */
  std::string group;
  EndpointRole role;
  std::string host;
  uint16_t port;

  bool isFake() const {
    return host == kFakeEndpointHost && port == kFakeEndpointPort;
  }

  /**
   * host:port
   */
  std::string getAddress() const;
};

bool operator==(const Endpoint& a, const Endpoint& b);

/**
 * Parses host:port.  Throws std::invalid_argument if the token is malformed
 * or the port is outside 1..65535.
 */
Endpoint parseEndpoint(const std::string& hostPort);

/**
 * Parses every entry of an endpoint list produced by the address translator
 * for the given mode.  Simple entries are host:port; replication entries are
 * group^M|S^host:port, optionally followed by -hostname.  Malformed entries
 * are logged and skipped; order is preserved.
 */
std::vector<Endpoint> parseEndpoints(
    ClusterMode mode,
    const std::vector<std::string>& endpoints);

/**
 * Number of endpoints that are not the fake placeholder.
 */
size_t countRealEndpoints(const std::vector<Endpoint>& endpoints);
}
}
