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

#include <gtest/gtest.h>
#include "arcus/client/ClusterPaths.h"

namespace arcus {
namespace client {

TEST(ClusterPathsTest, membershipPaths) {
  EXPECT_EQ(
      "/arcus/cache_list/test",
      paths::getMembershipPath(ClusterMode::SIMPLE, "test"));
  EXPECT_EQ(
      "/arcus_repl/cache_list/test",
      paths::getMembershipPath(ClusterMode::REPLICATION, "test"));
  EXPECT_EQ(
      "/arcus/client_list/test",
      paths::getPresenceBasePath(ClusterMode::SIMPLE, "test"));
  EXPECT_EQ(
      "/arcus_repl/client_list/test",
      paths::getPresenceBasePath(ClusterMode::REPLICATION, "test"));
}

TEST(ClusterPathsTest, presenceRecord) {
  struct tm local = {};
  local.tm_year = 2024 - 1900;
  local.tm_mon = 2;
  local.tm_mday = 7;
  local.tm_hour = 9;
  local.tm_min = 5;
  local.tm_sec = 3;
  local.tm_isdst = -1;
  auto t = mktime(&local);

  EXPECT_EQ("20240307090503", paths::formatTimestamp(t));

  PresenceRecord record{
      "myhost", "10.1.2.3", 4, "cpp", "1.2.3", t, 72057594037927937};
  EXPECT_EQ(
      "myhost_10.1.2.3_4_cpp_1.2.3_20240307090503_72057594037927937",
      paths::getPresenceRecordName(record));
  EXPECT_EQ(
      "/arcus_repl/client_list/svc/"
      "myhost_10.1.2.3_4_cpp_1.2.3_20240307090503_72057594037927937",
      paths::getPresenceRecordPath(ClusterMode::REPLICATION, "svc", record));
}

TEST(ClusterPathsTest, modeNames) {
  EXPECT_EQ("SIMPLE", toString(ClusterMode::SIMPLE));
  EXPECT_EQ("REPLICATION", toString(ClusterMode::REPLICATION));
}
}
}
