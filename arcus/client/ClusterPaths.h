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
#include <ctime>
#include <string>

namespace arcus {
namespace client {

/**
 * Node naming convention a service's membership path uses.
 */
enum class ClusterMode {
  /**
   * /arcus/cache_list/{svc}, children named ip:port-hostname
   */
  SIMPLE,
  /**
   * /arcus_repl/cache_list/{svc}, children named group^M|S^ip:port-hostname
   */
  REPLICATION,
};

std::string toString(ClusterMode mode);

/**
 * Identity of one running client, advertised as an ephemeral node under the
 * presence base path.
 */
struct PresenceRecord {
  std::string hostname;
  std::string ipAddress;
  size_t poolSize;
  std::string clientLangTag;
  std::string clientVersion;
  std::time_t createdAt;
  int64_t sessionId;
};

namespace paths {

std::string getBasePath(ClusterMode mode);

std::string getMembershipPath(ClusterMode mode, const std::string& serviceCode);

std::string getPresenceBasePath(
    ClusterMode mode,
    const std::string& serviceCode);

/**
 * {hostname}_{ip}_{poolSize}_{langTag}_{version}_{YYYYMMDDHHMMSS}_{sessionId}
 * with the timestamp in local time.
 */
std::string getPresenceRecordName(const PresenceRecord& record);

std::string getPresenceRecordPath(
    ClusterMode mode,
    const std::string& serviceCode,
    const PresenceRecord& record);

std::string formatTimestamp(std::time_t t);
}
}
}
