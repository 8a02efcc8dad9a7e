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

#include <folly/Function.h>
#include <string>

namespace arcus {
namespace client {

struct LocalHost {
  std::string hostname;
  std::string ipAddress;
};

/**
 * Throws std::runtime_error if the host name or its address cannot be
 * determined.
 */
using LocalHostResolver = folly::Function<LocalHost()>;

/**
 * gethostname() plus the first IPv4 address getaddrinfo() returns for it.
 */
LocalHost resolveLocalHost();
}
}
