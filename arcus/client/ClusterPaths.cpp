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

#include "arcus/client/ClusterPaths.h"
#include <folly/Conv.h>

namespace arcus {
namespace client {

std::string toString(ClusterMode mode) {
  switch (mode) {
    case ClusterMode::SIMPLE:
      return "SIMPLE";
    case ClusterMode::REPLICATION:
      return "REPLICATION";
    default:
      return "[unrecognized cluster mode]";
  }
}

namespace paths {

std::string getBasePath(ClusterMode mode) {
  return mode == ClusterMode::REPLICATION ? "/arcus_repl" : "/arcus";
}

std::string getMembershipPath(
    ClusterMode mode,
    const std::string& serviceCode) {
  return folly::to<std::string>(getBasePath(mode), "/cache_list/", serviceCode);
}

std::string getPresenceBasePath(
    ClusterMode mode,
    const std::string& serviceCode) {
  return folly::to<std::string>(
      getBasePath(mode), "/client_list/", serviceCode);
}

std::string formatTimestamp(std::time_t t) {
  struct tm local;
  localtime_r(&t, &local);
  char buf[16];
  auto n = strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &local);
  return std::string(buf, n);
}

std::string getPresenceRecordName(const PresenceRecord& record) {
  return folly::to<std::string>(
      record.hostname,
      "_",
      record.ipAddress,
      "_",
      record.poolSize,
      "_",
      record.clientLangTag,
      "_",
      record.clientVersion,
      "_",
      formatTimestamp(record.createdAt),
      "_",
      record.sessionId);
}

std::string getPresenceRecordPath(
    ClusterMode mode,
    const std::string& serviceCode,
    const PresenceRecord& record) {
  return folly::to<std::string>(
      getPresenceBasePath(mode, serviceCode),
      "/",
      getPresenceRecordName(record));
}
}
}
}
