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

#include <zookeeper/zookeeper.h>
#include <list>
#include <mutex>
#include "arcus/client/ZookeeperClient.h"
#include "arcus/client/detail/SimpleSessionEventWatcher.h"

namespace arcus {
namespace client {
namespace detail {

/**
 * IZookeeperClient over the ZooKeeper C client's asynchronous API.  Results
 * are delivered on the C client's completion thread; session events on its
 * event thread.  Obtain instances through makeBasicSessionFactory().
 */
class BasicZookeeperClient : public virtual IZookeeperClient,
                             public SimpleSessionEventWatcher {
 public:
  BasicZookeeperClient(
      const std::string& connectionString,
      std::chrono::milliseconds sessionTimeout);
  virtual ~BasicZookeeperClient();

  virtual SessionState getState() const override;

  virtual int64_t getSessionID() const override;

  virtual std::chrono::milliseconds getSessionTimeout() const override;

  virtual void close() override;

  virtual folly::Future<GetChildrenResult> getChildren(
      const std::string& path) override;
  virtual ChildrenWithWatch getChildrenWithWatch(
      const std::string& path) override;

  virtual folly::Future<folly::Optional<Stat>> exists(
      const std::string& path) override;

 protected:
  virtual folly::Future<CreateResult> createNodeInternal(
      const std::string& path,
      const std::string& data,
      CreateMode createMode) override;

 private:
  class ContextStorage;

  class ContextBase {
   public:
    virtual ~ContextBase() = default;

    void setIterator(
        const std::list<std::unique_ptr<ContextBase>>::iterator& i) {
      i_ = i;
    }

    std::list<std::unique_ptr<ContextBase>>::iterator getIterator() const {
      return i_;
    }

    void setStorage(ContextStorage* storage) {
      storage_ = storage;
    }

    ContextStorage* getStorage() {
      return storage_;
    }

   private:
    std::list<std::unique_ptr<ContextBase>>::iterator i_;
    ContextStorage* storage_{nullptr};
  };

  // Owns the context objects handed to the C client as callback data, so
  // that contexts whose callbacks never fire are freed when the client is
  // closed.  Callbacks extract() their context to free it on the happy path.
  class ContextStorage {
   public:
    template <class Context>
    Context* add(std::unique_ptr<Context>&& c) {
      std::unique_lock<std::mutex> g(lock_);
      auto* rawC = c.get();
      storage_.push_back(std::move(c));
      auto i = storage_.end();
      --i;
      g.unlock();
      rawC->setIterator(i);
      rawC->setStorage(this);
      return rawC;
    }

    template <class Context>
    void erase(Context* c) {
      std::unique_lock<std::mutex> g(lock_);
      storage_.erase(c->getIterator());
    }

    void closeAll() {
      std::unique_lock<std::mutex> g(lock_);
      auto contexts = std::move(storage_);
      storage_.clear();
      g.unlock();
      // destructors fulfil outstanding promises; run them unlocked
      contexts.clear();
    }

    template <class Context>
    static std::unique_ptr<Context> extract(const void* data) {
      auto* c = reinterpret_cast<Context*>(const_cast<void*>(data));
      auto* s = c->getStorage();
      if (s == nullptr) {
        return nullptr;
      }
      auto i = c->getIterator();
      std::unique_lock<std::mutex> g(s->lock_);
      auto* p = dynamic_cast<Context*>(i->get());
      if (p) {
        std::unique_ptr<Context> rval(p);
        i->release();
        s->storage_.erase(i);
        rval->setStorage(nullptr);
        return rval;
      } else {
        throw std::logic_error("dynamic_cast failed");
      }
    }

   private:
    std::mutex lock_;
    std::list<std::unique_ptr<ContextBase>> storage_;
  };

  template <class T>
  class Context : public ContextBase {
   public:
    explicit Context(const std::string& inPath) : path(inPath) {}

    ~Context() {
      if (!p_.isFulfilled()) {
        p_.setException(ZookeeperClosingException());
      }
    }

    folly::Promise<T>& getPromise() {
      return p_;
    }

    std::string path;

   private:
    folly::Promise<T> p_;
  };

  class WatchContext : public ContextBase {
   public:
    explicit WatchContext(const BasicZookeeperClient* client)
        : client_(client) {}

    ~WatchContext() {
      if (!p_.isFulfilled()) {
        auto state = client_->getNextIndexAndCurrentState();
        p_.setValue(
            NodeEvent{state.first, "", WatchEventType::CLOSING, state.second});
      }
    }

    folly::Promise<NodeEvent>& getPromise() {
      return p_;
    }

    const BasicZookeeperClient* getClient() const {
      return client_;
    }

   private:
    const BasicZookeeperClient* client_;
    folly::Promise<NodeEvent> p_;
  };

  using OptionalStatContext = Context<folly::Optional<Stat>>;
  using CreateContext = Context<CreateResult>;
  using GetChildrenContext = Context<GetChildrenResult>;

  template <class T>
  static void sCallbackException(folly::Promise<T>& p, int rc);

  static Stat convertStat(const ::Stat& s);

  static SessionState convertStateType(int state);

  static NodeEvent convertWatchEventType(
      const char* path,
      int type,
      int state,
      size_t index = 0);

  static int convertCreateMode(const CreateMode&);

  static void sSessionWatchCallback(
      zhandle_t*,
      int type,
      int state,
      const char* path,
      void* watcherCtx);

  static void sWatchCallback(
      zhandle_t*,
      int type,
      int state,
      const char* path,
      void* watcherCtx);

  static void
  sOptionalStatCallback(int rc, const ::Stat* stat, const void* data);

  static void sCreateCallback(int rc, const char* value, const void* data);

  static void sGetChildrenCallback(
      int rc,
      const ::String_vector* strings,
      const ::Stat* stat,
      const void* data);

  mutable folly::SharedMutex zhLock_;
  zhandle_t* zh_;

  ContextStorage contextStorage_;
};
}
}
}
