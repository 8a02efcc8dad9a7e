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

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace arcus {
namespace client {

/**
 * Base of every error reported by the coordination-store client.  The return
 * code is the ZooKeeper C client's code for the condition.
 */
class ZookeeperException : public std::runtime_error {
 public:
  virtual int getReturnCode() const = 0;
  std::string getReturnCodeDescription() const;

 protected:
  explicit ZookeeperException(const std::string& what)
      : std::runtime_error(what) {}
  virtual ~ZookeeperException() {}
};

/**
 * A return code the client library did not expect for the operation.
 */
class ZookeeperUnexpectedException : public ZookeeperException {
 public:
  explicit ZookeeperUnexpectedException(int rc);
  virtual ~ZookeeperUnexpectedException() = default;

  virtual int getReturnCode() const override;

 private:
  int rc_;
};

class ZookeeperSystemException : public ZookeeperException {
 protected:
  explicit ZookeeperSystemException(const std::string& what)
      : ZookeeperException(what) {}
  virtual ~ZookeeperSystemException() {}
};

/**
 * Transient: the request may succeed once the session reconnects.
 */
class ZookeeperNetworkException : public ZookeeperSystemException {
 protected:
  explicit ZookeeperNetworkException(const std::string& what)
      : ZookeeperSystemException(what) {}

 public:
  virtual ~ZookeeperNetworkException() {}
};

class ZookeeperClientException : public ZookeeperException {
 protected:
  explicit ZookeeperClientException(const std::string& what)
      : ZookeeperException(what) {}
  virtual ~ZookeeperClientException() {}
};

/**
 * The session is unusable; it has to be closed and a new one created.
 */
class ZookeeperClientClosingException : public ZookeeperClientException {
 protected:
  explicit ZookeeperClientClosingException(const std::string& what)
      : ZookeeperClientException(what) {}
  virtual ~ZookeeperClientClosingException() {}
};

class ZookeeperPathException : public ZookeeperClientException {
 protected:
  ZookeeperPathException(const std::string& what, std::string&& path)
      : ZookeeperClientException(what + " " + path), path_(std::move(path)) {}
  virtual ~ZookeeperPathException() {}

 public:
  const std::string& getPath() const {
    return path_;
  }

 private:
  std::string path_;
};

class ZookeeperSystemErrorException : public ZookeeperSystemException {
 public:
  ZookeeperSystemErrorException()
      : ZookeeperSystemException(std::strerror(errno)) {}
  virtual ~ZookeeperSystemErrorException() = default;

  virtual int getReturnCode() const override;
};

class ZookeeperConnectionLossException : public ZookeeperNetworkException {
 public:
  ZookeeperConnectionLossException()
      : ZookeeperNetworkException("connection lost") {}

  virtual int getReturnCode() const override;
};

class ZookeeperTimeoutException : public ZookeeperNetworkException {
 public:
  ZookeeperTimeoutException()
      : ZookeeperNetworkException("operation timed out") {}

  virtual int getReturnCode() const override;
};

class ZookeeperMarshallingException : public ZookeeperSystemException {
 public:
  ZookeeperMarshallingException()
      : ZookeeperSystemException("marshalling error") {}

  virtual int getReturnCode() const override;
};

class ZookeeperBadArgumentsException : public ZookeeperSystemException {
 public:
  ZookeeperBadArgumentsException()
      : ZookeeperSystemException("bad arguments") {}

  virtual int getReturnCode() const override;
};

class ZookeeperInvalidStateException : public ZookeeperSystemException {
 public:
  ZookeeperInvalidStateException()
      : ZookeeperSystemException("invalid client state") {}

  virtual int getReturnCode() const override;
};

class ZookeeperNoNodeException : public ZookeeperPathException {
 public:
  explicit ZookeeperNoNodeException(std::string&& path)
      : ZookeeperPathException("no node found at path", std::move(path)) {}

  virtual int getReturnCode() const override;
};

class ZookeeperNoAuthException : public ZookeeperClientException {
 public:
  ZookeeperNoAuthException() : ZookeeperClientException("not authenticated") {}

  virtual int getReturnCode() const override;
};

class ZookeeperNodeExistsException : public ZookeeperPathException {
 public:
  explicit ZookeeperNodeExistsException(std::string&& path)
      : ZookeeperPathException("node already exists:", std::move(path)) {}

  virtual int getReturnCode() const override;
};

class ZookeeperNoChildrenForEphemeralsException
    : public ZookeeperPathException {
 public:
  explicit ZookeeperNoChildrenForEphemeralsException(std::string&& path)
      : ZookeeperPathException(
            "ephemeral node cannot have children:",
            std::move(path)) {}

  virtual int getReturnCode() const override;
};

class ZookeeperSessionExpiredException
    : public ZookeeperClientClosingException {
 public:
  ZookeeperSessionExpiredException()
      : ZookeeperClientClosingException("session expired") {}

  virtual int getReturnCode() const override;
};

class ZookeeperAuthFailedException : public ZookeeperClientClosingException {
 public:
  ZookeeperAuthFailedException()
      : ZookeeperClientClosingException("authentication failed") {}

  virtual int getReturnCode() const override;
};

class ZookeeperClosingException : public ZookeeperClientException {
 public:
  ZookeeperClosingException()
      : ZookeeperClientException("Zookeeper is closing") {}

  virtual int getReturnCode() const override;
};
}
}
