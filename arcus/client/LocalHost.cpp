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

#include "arcus/client/LocalHost.h"
#include <arpa/inet.h>
#include <folly/Conv.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace arcus {
namespace client {

LocalHost resolveLocalHost() {
  char name[256];
  if (gethostname(name, sizeof(name)) != 0) {
    throw std::runtime_error(folly::to<std::string>(
        "gethostname failed: ", std::strerror(errno)));
  }
  name[sizeof(name) - 1] = '\0';

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  int rc = getaddrinfo(name, nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    throw std::runtime_error(folly::to<std::string>(
        "can't resolve local host ", name, ": ", gai_strerror(rc)));
  }

  char ip[INET_ADDRSTRLEN];
  auto* addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
  const char* p = inet_ntop(AF_INET, &addr->sin_addr, ip, sizeof(ip));
  freeaddrinfo(res);
  if (p == nullptr) {
    throw std::runtime_error(folly::to<std::string>(
        "inet_ntop failed: ", std::strerror(errno)));
  }
  return LocalHost{name, ip};
}
}
}
