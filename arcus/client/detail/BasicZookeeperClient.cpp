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

#include "arcus/client/detail/BasicZookeeperClient.h"
#include <folly/Conv.h>
#include <glog/logging.h>
#include <shared_mutex>

namespace arcus {
namespace client {
namespace detail {

namespace {
// Maps glog's verbosity onto the C client's own log level, once.
class InitZooKeeperLogging {
 public:
  InitZooKeeperLogging() {
    if (FLAGS_v > 0) {
      zoo_set_debug_level(ZOO_LOG_LEVEL_DEBUG);
    } else if (FLAGS_minloglevel <= google::GLOG_INFO) {
      zoo_set_debug_level(ZOO_LOG_LEVEL_INFO);
    } else if (FLAGS_minloglevel <= google::GLOG_WARNING) {
      zoo_set_debug_level(ZOO_LOG_LEVEL_WARN);
    } else {
      zoo_set_debug_level(ZOO_LOG_LEVEL_ERROR);
    }
  }
};

template <class T>
T processSynchronousErrorCodes(int rc) {
  switch (rc) {
    case ZBADARGUMENTS:
      throw ZookeeperBadArgumentsException();
    case ZINVALIDSTATE:
      throw ZookeeperInvalidStateException();
    case ZMARSHALLINGERROR:
      throw ZookeeperMarshallingException();
    case ZSYSTEMERROR:
      throw ZookeeperSystemErrorException();
    default:
      throw ZookeeperUnexpectedException(rc);
  }
}
}

Stat BasicZookeeperClient::convertStat(const ::Stat& s) {
  return Stat{s.czxid,
              s.mzxid,
              s.version,
              s.cversion,
              s.ephemeralOwner,
              s.numChildren};
}

int BasicZookeeperClient::convertCreateMode(const CreateMode& m) {
  int flags = 0;
  if (m.isEphemeral) {
    flags |= ZOO_EPHEMERAL;
  }
  if (m.isSequential) {
    flags |= ZOO_SEQUENCE;
  }
  return flags;
}

SessionState BasicZookeeperClient::convertStateType(int state) {
  if (state == ZOO_EXPIRED_SESSION_STATE) {
    return SessionState::EXPIRED;
  } else if (state == ZOO_AUTH_FAILED_STATE) {
    return SessionState::AUTH_FAILED;
  } else if (state == ZOO_CONNECTING_STATE) {
    return SessionState::CONNECTING;
  } else if (state == ZOO_ASSOCIATING_STATE) {
    return SessionState::ASSOCIATING;
  } else if (state == ZOO_CONNECTED_STATE) {
    return SessionState::CONNECTED;
  } else if (state == ZOO_READONLY_STATE) {
    return SessionState::READONLY;
  } else if (state == 0 || state == ZOO_NOTCONNECTED_STATE) {
    return SessionState::DISCONNECTED;
  } else {
    throw std::runtime_error(
        folly::to<std::string>("unrecognized ZK state ", state));
  }
}

NodeEvent BasicZookeeperClient::convertWatchEventType(
    const char* path,
    int inType,
    int inState,
    size_t index) {
  WatchEventType type;
  if (inType == ZOO_CREATED_EVENT) {
    type = WatchEventType::CREATED;
  } else if (inType == ZOO_DELETED_EVENT) {
    type = WatchEventType::DELETED;
  } else if (inType == ZOO_CHANGED_EVENT) {
    type = WatchEventType::CHANGED;
  } else if (inType == ZOO_CHILD_EVENT) {
    type = WatchEventType::CHILD;
  } else if (inType == ZOO_SESSION_EVENT) {
    type = WatchEventType::SESSION;
  } else if (inType == ZOO_NOTWATCHING_EVENT) {
    type = WatchEventType::NOT_WATCHING;
  } else {
    throw std::runtime_error(
        folly::to<std::string>("unexpected watch event type ", inType));
  }

  return NodeEvent{
      index, path == nullptr ? "" : path, type, convertStateType(inState)};
}

BasicZookeeperClient::BasicZookeeperClient(
    const std::string& connectionString,
    std::chrono::milliseconds sessionTimeout) {
  static InitZooKeeperLogging initZooKeeperLogging;

  std::unique_lock<folly::SharedMutex> g(zhLock_);
  zh_ = zookeeper_init(
      connectionString.c_str(),
      sSessionWatchCallback,
      sessionTimeout.count(),
      nullptr,
      this,
      0);
  if (zh_ == nullptr) {
    throw ZookeeperSystemErrorException();
  }
}

BasicZookeeperClient::~BasicZookeeperClient() {
  std::unique_lock<folly::SharedMutex> g(zhLock_);
  if (zh_ != nullptr) {
    int rc = zookeeper_close(zh_);
    zh_ = nullptr;
    if (rc != ZOK) {
      LOG(ERROR) << "error closing Zookeeper session, error code = " << rc;
    }
  }
  g.unlock();
  contextStorage_.closeAll();
}

int64_t BasicZookeeperClient::getSessionID() const {
  std::shared_lock<folly::SharedMutex> g(zhLock_);
  if (zh_ == nullptr) {
    return 0;
  }
  return zoo_client_id(zh_)->client_id;
}

std::chrono::milliseconds BasicZookeeperClient::getSessionTimeout() const {
  std::shared_lock<folly::SharedMutex> g(zhLock_);
  if (zh_ == nullptr) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::milliseconds(zoo_recv_timeout(zh_));
}

SessionState BasicZookeeperClient::getState() const {
  std::shared_lock<folly::SharedMutex> g(zhLock_);
  if (zh_ == nullptr) {
    return SessionState::DISCONNECTED;
  } else {
    auto rc = zoo_state(zh_);
    g.unlock();
    return convertStateType(rc);
  }
}

void BasicZookeeperClient::close() {
  std::unique_lock<folly::SharedMutex> g(zhLock_);
  if (zh_ != nullptr) {
    int rc = zookeeper_close(zh_);
    zh_ = nullptr;
    g.unlock();
    contextStorage_.closeAll();
    if (rc != ZOK) {
      processSynchronousErrorCodes<void>(rc);
    }
  }
}

void BasicZookeeperClient::sSessionWatchCallback(
    zhandle_t*,
    int type,
    int state,
    const char* path,
    void* watcherCtx) {
  if (type != ZOO_SESSION_EVENT) {
    return;
  }
  auto* c = reinterpret_cast<BasicZookeeperClient*>(watcherCtx);
  try {
    c->onSessionEvent(convertStateType(state));
  } catch (const std::runtime_error& e) {
    LOG(ERROR) << "dropping session event: " << e.what();
  }
}

template <class T>
void BasicZookeeperClient::sCallbackException(folly::Promise<T>& p, int rc) {
  switch (rc) {
    case ZNOAUTH:
      p.setException(ZookeeperNoAuthException());
      break;
    case ZCONNECTIONLOSS:
      p.setException(ZookeeperConnectionLossException());
      break;
    case ZOPERATIONTIMEOUT:
      p.setException(ZookeeperTimeoutException());
      break;
    case ZSESSIONEXPIRED:
      p.setException(ZookeeperSessionExpiredException());
      break;
    case ZAUTHFAILED:
      p.setException(ZookeeperAuthFailedException());
      break;
    default:
      p.setException(ZookeeperUnexpectedException(rc));
      break;
  }
}

void BasicZookeeperClient::sWatchCallback(
    zhandle_t*,
    int type,
    int state,
    const char* path,
    void* watcherCtx) {
  // session events reach every watcher; sSessionWatchCallback handles them
  if (type == ZOO_SESSION_EVENT) {
    return;
  }
  auto c = ContextStorage::extract<WatchContext>(watcherCtx);
  if (!c) {
    return;
  }
  try {
    c->getPromise().setValue(convertWatchEventType(
        path, type, state, c->getClient()->getNextIndex()));
  } catch (const std::runtime_error& e) {
    LOG(ERROR) << "dropping watch event: " << e.what();
  }
}

void BasicZookeeperClient::sOptionalStatCallback(
    int rc,
    const ::Stat* stat,
    const void* data) {
  if (rc == ZCLOSING) {
    return;
  }

  auto c = ContextStorage::extract<OptionalStatContext>(data);
  if (!c) {
    return;
  }

  switch (rc) {
    case ZOK:
      c->getPromise().setValue(convertStat(*stat));
      break;
    case ZNONODE:
      c->getPromise().setValue(folly::none);
      break;
    default:
      sCallbackException(c->getPromise(), rc);
      break;
  }
}

void BasicZookeeperClient::sCreateCallback(
    int rc,
    const char* value,
    const void* data) {
  if (rc == ZCLOSING) {
    return;
  }

  auto c = ContextStorage::extract<CreateContext>(data);
  if (!c) {
    return;
  }

  switch (rc) {
    case ZOK:
      c->getPromise().setValue(CreateResult{value});
      break;
    case ZNOCHILDRENFOREPHEMERALS:
      c->getPromise().setException(
          ZookeeperNoChildrenForEphemeralsException(std::move(c->path)));
      break;
    case ZNODEEXISTS:
      c->getPromise().setException(
          ZookeeperNodeExistsException(std::move(c->path)));
      break;
    case ZNONODE:
      // Parent does not exist
      c->getPromise().setException(
          ZookeeperNoNodeException(c->path.substr(0, c->path.rfind('/'))));
      break;
    default:
      sCallbackException(c->getPromise(), rc);
      break;
  }
}

void BasicZookeeperClient::sGetChildrenCallback(
    int rc,
    const ::String_vector* strings,
    const ::Stat* stat,
    const void* data) {
  if (rc == ZCLOSING) {
    return;
  }

  auto c = ContextStorage::extract<GetChildrenContext>(data);
  if (!c) {
    return;
  }

  if (rc == ZOK) {
    std::vector<std::string> children;
    for (int i = 0; i < strings->count; ++i) {
      children.emplace_back(strings->data[i]);
    }
    c->getPromise().setValue(
        GetChildrenResult{std::move(children), convertStat(*stat)});
  } else {
    switch (rc) {
      case ZNONODE:
        c->getPromise().setException(
            ZookeeperNoNodeException(std::move(c->path)));
        break;
      default:
        sCallbackException(c->getPromise(), rc);
        break;
    }
  }
}

folly::Future<CreateResult> BasicZookeeperClient::createNodeInternal(
    const std::string& path,
    const std::string& data,
    CreateMode createMode) {
  auto* c = contextStorage_.add(std::make_unique<CreateContext>(path));
  auto f = c->getPromise().getFuture();

  std::shared_lock<folly::SharedMutex> zhg(zhLock_);
  if (zh_ == nullptr) {
    zhg.unlock();
    contextStorage_.erase(c);
    return folly::makeFuture<CreateResult>(ZookeeperClosingException());
  }
  int rc = zoo_acreate(
      zh_,
      path.c_str(),
      data.data(),
      data.size(),
      &ZOO_OPEN_ACL_UNSAFE,
      convertCreateMode(createMode),
      sCreateCallback,
      reinterpret_cast<void*>(c));
  zhg.unlock();

  if (rc == ZOK) {
    return f;
  } else {
    contextStorage_.erase(c);
    return processSynchronousErrorCodes<folly::Future<CreateResult>>(rc);
  }
}

folly::Future<GetChildrenResult> BasicZookeeperClient::getChildren(
    const std::string& path) {
  auto* c = contextStorage_.add(std::make_unique<GetChildrenContext>(path));
  auto f = c->getPromise().getFuture();

  std::shared_lock<folly::SharedMutex> zhg(zhLock_);
  if (zh_ == nullptr) {
    zhg.unlock();
    contextStorage_.erase(c);
    return folly::makeFuture<GetChildrenResult>(ZookeeperClosingException());
  }
  int rc = zoo_aget_children2(
      zh_,
      path.c_str(),
      0,
      sGetChildrenCallback,
      reinterpret_cast<void*>(c));
  zhg.unlock();

  if (rc == ZOK) {
    return f;
  } else {
    contextStorage_.erase(c);
    return processSynchronousErrorCodes<folly::Future<GetChildrenResult>>(rc);
  }
}

ChildrenWithWatch BasicZookeeperClient::getChildrenWithWatch(
    const std::string& path) {
  auto* gc = contextStorage_.add(std::make_unique<GetChildrenContext>(path));
  auto gf = gc->getPromise().getFuture();
  auto* wc = contextStorage_.add(std::make_unique<WatchContext>(this));
  auto wf = wc->getPromise().getFuture();

  std::shared_lock<folly::SharedMutex> zhg(zhLock_);
  if (zh_ == nullptr) {
    zhg.unlock();
    contextStorage_.erase(gc);
    contextStorage_.erase(wc);
    throw ZookeeperClosingException();
  }
  int rc = zoo_awget_children2(
      zh_, path.c_str(), sWatchCallback, wc, sGetChildrenCallback, gc);
  zhg.unlock();

  if (rc == ZOK) {
    return ChildrenWithWatch{std::move(gf), std::move(wf)};
  } else {
    contextStorage_.erase(gc);
    contextStorage_.erase(wc);
    return processSynchronousErrorCodes<ChildrenWithWatch>(rc);
  }
}

folly::Future<folly::Optional<Stat>> BasicZookeeperClient::exists(
    const std::string& path) {
  auto* c = contextStorage_.add(std::make_unique<OptionalStatContext>(path));
  auto f = c->getPromise().getFuture();

  std::shared_lock<folly::SharedMutex> zhg(zhLock_);
  if (zh_ == nullptr) {
    zhg.unlock();
    contextStorage_.erase(c);
    return folly::makeFuture<folly::Optional<Stat>>(
        ZookeeperClosingException());
  }
  int rc = zoo_aexists(
      zh_, path.c_str(), 0, sOptionalStatCallback, reinterpret_cast<void*>(c));
  zhg.unlock();

  if (rc == ZOK) {
    return f;
  } else {
    contextStorage_.erase(c);
    return processSynchronousErrorCodes<folly::Future<folly::Optional<Stat>>>(
        rc);
  }
}
}

SessionFactory makeBasicSessionFactory() {
  return [](const std::string& connectionString,
            std::chrono::milliseconds sessionTimeout)
             -> std::shared_ptr<IZookeeperClient> {
    return std::make_shared<detail::BasicZookeeperClient>(
        connectionString, sessionTimeout);
  };
}
}
}
