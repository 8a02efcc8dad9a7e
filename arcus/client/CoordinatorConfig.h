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
#include <string>

namespace arcus {
namespace client {

/**
 * Configuration of a ClusterCoordinator.  The admin address and service code
 * are fixed at construction; the rest have defaults and setters that validate
 * their argument.
 */
class CoordinatorConfig {
 public:
  static constexpr std::chrono::milliseconds kDefaultSessionTimeout{15000};
  static constexpr std::chrono::milliseconds kDefaultRetryDelay{5000};

  /**
   * @param adminAddress comma separated host:port list of the ensemble
   * @param serviceCode name of the cache cluster
   *
   * Throws std::invalid_argument if either is empty.
   */
  CoordinatorConfig(
      const std::string& adminAddress,
      const std::string& serviceCode);

  const std::string& getAdminAddress() const {
    return adminAddress_;
  }

  const std::string& getServiceCode() const {
    return serviceCode_;
  }

  size_t getPoolSize() const {
    return poolSize_;
  }

  /**
   * Throws std::invalid_argument if poolSize is zero.
   */
  CoordinatorConfig& setPoolSize(size_t poolSize);

  /**
   * How long the initial pool build waits for connections.  Zero means 50ms
   * for every real endpoint.
   */
  std::chrono::milliseconds getWaitTimeForConnect() const {
    return waitTimeForConnect_;
  }

  CoordinatorConfig& setWaitTimeForConnect(std::chrono::milliseconds wait);

  std::chrono::milliseconds getSessionTimeout() const {
    return sessionTimeout_;
  }

  CoordinatorConfig& setSessionTimeout(std::chrono::milliseconds timeout);

  /**
   * How long an attempt waits for the session to connect.  Follows the
   * session timeout unless set explicitly.
   */
  std::chrono::milliseconds getConnectTimeout() const;

  CoordinatorConfig& setConnectTimeout(std::chrono::milliseconds timeout);

  /**
   * Pause between failed session attempts of the background loop.
   */
  std::chrono::milliseconds getRetryDelay() const {
    return retryDelay_;
  }

  CoordinatorConfig& setRetryDelay(std::chrono::milliseconds delay);

  const std::string& getClientLangTag() const {
    return clientLangTag_;
  }

  /**
   * Throws std::invalid_argument if the tag is empty or contains '_' or '/'.
   */
  CoordinatorConfig& setClientLangTag(const std::string& tag);

 private:
  std::string adminAddress_;
  std::string serviceCode_;
  size_t poolSize_;
  std::chrono::milliseconds waitTimeForConnect_;
  std::chrono::milliseconds sessionTimeout_;
  std::chrono::milliseconds connectTimeout_;
  std::chrono::milliseconds retryDelay_;
  std::string clientLangTag_;
};
}
}
