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

#include <stdexcept>
#include <string>

namespace arcus {
namespace client {

/**
 * Base of the errors a coordinator reports from its first, synchronous
 * session attempt.  Later attempts log these and retry.
 */
class CoordinatorException : public std::runtime_error {
 protected:
  explicit CoordinatorException(const std::string& what)
      : std::runtime_error(what) {}

 public:
  virtual ~CoordinatorException() {}
};

/**
 * The coordination store did not report a connected session within the
 * connect timeout.
 */
class AdminConnectTimeoutException : public CoordinatorException {
 public:
  explicit AdminConnectTimeoutException(const std::string& adminAddress)
      : CoordinatorException("can't connect to Arcus admin (" + adminAddress +
                             ")") {}
};

/**
 * Neither the replication nor the simple membership path exists for the
 * service code.
 */
class ServiceNotFoundException : public CoordinatorException {
 public:
  explicit ServiceNotFoundException(const std::string& serviceCode)
      : CoordinatorException("service code not found: " + serviceCode) {}
};

class InitializationException : public CoordinatorException {
 public:
  explicit InitializationException(const std::string& what)
      : CoordinatorException("can't initialize Arcus client: " + what) {}
};
}
}
