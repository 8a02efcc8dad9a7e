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

#include "arcus/client/Endpoint.h"
#include <folly/Conv.h>
#include <folly/String.h>
#include <glog/logging.h>
#include <stdexcept>

namespace arcus {
namespace client {

std::string Endpoint::getAddress() const {
  return folly::to<std::string>(host, ":", port);
}

bool operator==(const Endpoint& a, const Endpoint& b) {
  return a.group == b.group && a.role == b.role && a.host == b.host &&
      a.port == b.port;
}

Endpoint parseEndpoint(const std::string& hostPort) {
  auto colon = hostPort.rfind(':');
  if (colon == std::string::npos || colon == 0 ||
      colon + 1 == hostPort.size()) {
    throw std::invalid_argument("malformed endpoint: " + hostPort);
  }
  uint16_t port;
  try {
    port = folly::to<uint16_t>(hostPort.substr(colon + 1));
  } catch (const std::range_error&) {
    throw std::invalid_argument("malformed port in endpoint: " + hostPort);
  }
  if (port == 0) {
    throw std::invalid_argument("port out of range in endpoint: " + hostPort);
  }
  return Endpoint{"", EndpointRole::NONE, hostPort.substr(0, colon), port};
}

namespace {
Endpoint parseReplicationEndpoint(const std::string& name) {
  std::vector<std::string> parts;
  folly::split('^', name, parts);
  if (parts.size() != 3 || parts[0].empty()) {
    throw std::invalid_argument("malformed replication endpoint: " + name);
  }

  EndpointRole role;
  if (parts[1] == "M") {
    role = EndpointRole::MASTER;
  } else if (parts[1] == "S") {
    role = EndpointRole::SLAVE;
  } else {
    throw std::invalid_argument("unknown role in endpoint: " + name);
  }

  auto e = parseEndpoint(parts[2].substr(0, parts[2].find('-')));
  e.group = parts[0];
  e.role = role;
  return e;
}
}

std::vector<Endpoint> parseEndpoints(
    ClusterMode mode,
    const std::vector<std::string>& endpoints) {
  std::vector<Endpoint> rval;
  rval.reserve(endpoints.size());
  for (const auto& entry : endpoints) {
    try {
      if (mode == ClusterMode::REPLICATION) {
        rval.push_back(parseReplicationEndpoint(entry));
      } else {
        rval.push_back(parseEndpoint(entry));
      }
    } catch (const std::invalid_argument& e) {
      LOG(ERROR) << "skipping endpoint: " << e.what();
    }
  }
  return rval;
}

size_t countRealEndpoints(const std::vector<Endpoint>& endpoints) {
  size_t count = 0;
  for (const auto& e : endpoints) {
    if (!e.isFake()) {
      ++count;
    }
  }
  return count;
}
}
}
