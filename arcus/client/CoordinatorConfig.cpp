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

#include "arcus/client/CoordinatorConfig.h"
#include <stdexcept>
#include "arcus/client/Version.h"

namespace arcus {
namespace client {

constexpr std::chrono::milliseconds CoordinatorConfig::kDefaultSessionTimeout;
constexpr std::chrono::milliseconds CoordinatorConfig::kDefaultRetryDelay;

CoordinatorConfig::CoordinatorConfig(
    const std::string& adminAddress,
    const std::string& serviceCode)
    : adminAddress_(adminAddress),
      serviceCode_(serviceCode),
      poolSize_(1),
      waitTimeForConnect_(0),
      sessionTimeout_(kDefaultSessionTimeout),
      connectTimeout_(0),
      retryDelay_(kDefaultRetryDelay),
      clientLangTag_(ARCUS_CLIENT_LANG_TAG) {
  if (adminAddress_.empty()) {
    throw std::invalid_argument("admin address must not be empty");
  }
  if (serviceCode_.empty()) {
    throw std::invalid_argument("service code must not be empty");
  }
  if (serviceCode_.find('/') != std::string::npos) {
    throw std::invalid_argument("service code must not contain '/'");
  }
}

CoordinatorConfig& CoordinatorConfig::setPoolSize(size_t poolSize) {
  if (poolSize < 1) {
    throw std::invalid_argument("pool size must be at least 1");
  }
  poolSize_ = poolSize;
  return *this;
}

CoordinatorConfig& CoordinatorConfig::setWaitTimeForConnect(
    std::chrono::milliseconds wait) {
  if (wait.count() < 0) {
    throw std::invalid_argument("wait time for connect must not be negative");
  }
  waitTimeForConnect_ = wait;
  return *this;
}

CoordinatorConfig& CoordinatorConfig::setSessionTimeout(
    std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    throw std::invalid_argument("session timeout must be positive");
  }
  sessionTimeout_ = timeout;
  return *this;
}

std::chrono::milliseconds CoordinatorConfig::getConnectTimeout() const {
  return connectTimeout_.count() > 0 ? connectTimeout_ : sessionTimeout_;
}

CoordinatorConfig& CoordinatorConfig::setConnectTimeout(
    std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    throw std::invalid_argument("connect timeout must be positive");
  }
  connectTimeout_ = timeout;
  return *this;
}

CoordinatorConfig& CoordinatorConfig::setRetryDelay(
    std::chrono::milliseconds delay) {
  if (delay.count() < 0) {
    throw std::invalid_argument("retry delay must not be negative");
  }
  retryDelay_ = delay;
  return *this;
}

CoordinatorConfig& CoordinatorConfig::setClientLangTag(const std::string& tag) {
  if (tag.empty() || tag.find_first_of("_/") != std::string::npos) {
    throw std::invalid_argument("invalid client language tag: " + tag);
  }
  clientLangTag_ = tag;
  return *this;
}
}
}
