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

#include <folly/Conv.h>
#include <folly/String.h>
#include <getopt.h>
#include <glog/logging.h>
#include <signal.h>
#include <iostream>
#include "arcus/client/ClusterCoordinator.h"

using namespace arcus::client;

namespace {

// The set of "long" options accepted by this program.
struct option long_options[] = {
    {"help", no_argument, nullptr, 'h'},
    {"zookeeper", required_argument, nullptr, 'z'},
    {"service", required_argument, nullptr, 's'},
    {"pool", required_argument, nullptr, 'p'},
    {"wait", required_argument, nullptr, 'w'},
    {"session-timeout", required_argument, nullptr, 't'},
    {"retry-delay", required_argument, nullptr, 'r'},
    {"duration", required_argument, nullptr, 'd'},
    {nullptr, 0, nullptr, 0}};
const char* short_options = "hz:s:p:w:t:r:d:";

void usage(const char* prog) {
  std::cout
      << "Watches the membership of an Arcus cache cluster and prints every"
      << std::endl
      << "address list the client pool would receive." << std::endl
      << "Usage: " << prog << " --zookeeper=<hosts> --service=<code> [options]"
      << std::endl
      << "\t--zookeeper=<hosts> or -z <hosts>: admin ensemble, host:port,..."
      << std::endl
      << "\t--service=<code> or -s <code>: service code of the cluster"
      << std::endl
      << "\t--pool=<n> or -p <n>: number of pool clients (default 1)"
      << std::endl
      << "\t--wait=<ms> or -w <ms>: startup connect wait (default 50ms per"
      << std::endl
      << "\t  endpoint)" << std::endl
      << "\t--session-timeout=<ms> or -t <ms>: session timeout (default 15000)"
      << std::endl
      << "\t--retry-delay=<ms> or -r <ms>: reconnect delay (default 5000)"
      << std::endl
      << "\t--duration=<s> or -d <s>: exit after this many seconds (default:"
      << std::endl
      << "\t  run until interrupted)" << std::endl
      << "\t--help or -h: prints this message" << std::endl;
}

/**
 * Pool client that prints what it is asked to do instead of dialing.
 */
class PrintingCacheClient : public ICacheClient {
 public:
  PrintingCacheClient(
      const std::string& name,
      const std::vector<std::string>& endpoints)
      : name_(name) {
    std::cout << name_ << ": initial " << folly::join(",", endpoints)
              << std::endl;
  }

  void pushAddressUpdate(const std::string& addresses) override {
    std::cout << name_ << ": update " << addresses << std::endl;
  }

  void wakeEventLoop() override {}

 private:
  std::string name_;
};

class PrintingCacheClientFactory : public ICacheClientFactory {
 public:
  std::unique_ptr<ICacheClient> create(
      ClusterMode mode,
      const std::string& name,
      const std::vector<std::string>& endpoints,
      std::shared_ptr<IConnectionObserver>) override {
    std::cout << name << ": " << toString(mode) << " cluster" << std::endl;
    return std::make_unique<PrintingCacheClient>(name, endpoints);
  }
};

std::chrono::milliseconds toMillis(const char* arg) {
  return std::chrono::milliseconds(folly::to<int64_t>(arg));
}
}

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  std::string zookeeper;
  std::string service;
  size_t pool = 1;
  folly::Optional<std::chrono::milliseconds> wait;
  folly::Optional<std::chrono::milliseconds> sessionTimeout;
  folly::Optional<std::chrono::milliseconds> retryDelay;
  int64_t duration = 0;

  int opt;
  try {
    while ((opt = getopt_long(
                argc, argv, short_options, long_options, nullptr)) != -1) {
      switch (opt) {
        case 'z':
          zookeeper = optarg;
          break;
        case 's':
          service = optarg;
          break;
        case 'p':
          pool = folly::to<size_t>(optarg);
          break;
        case 'w':
          wait = toMillis(optarg);
          break;
        case 't':
          sessionTimeout = toMillis(optarg);
          break;
        case 'r':
          retryDelay = toMillis(optarg);
          break;
        case 'd':
          duration = folly::to<int64_t>(optarg);
          break;
        case 'h':
          usage(argv[0]);
          return 0;
        default:
          usage(argv[0]);
          return 1;
      }
    }
  } catch (const std::range_error& e) {
    std::cerr << "bad option value: " << e.what() << std::endl;
    return 1;
  }

  if (zookeeper.empty() || service.empty()) {
    usage(argv[0]);
    return 1;
  }

  // Handle SIGINT/SIGTERM synchronously; block them before any thread starts.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try {
    CoordinatorConfig config(zookeeper, service);
    config.setPoolSize(pool);
    if (wait) {
      config.setWaitTimeForConnect(*wait);
    }
    if (sessionTimeout) {
      config.setSessionTimeout(*sessionTimeout);
    }
    if (retryDelay) {
      config.setRetryDelay(*retryDelay);
    }

    ClusterCoordinator coordinator(
        config, std::make_shared<PrintingCacheClientFactory>());
    LOG(INFO) << "watching " << service << " ("
              << toString(coordinator.getClusterMode().value()) << ")";

    if (duration > 0) {
      struct timespec ts;
      ts.tv_sec = duration;
      ts.tv_nsec = 0;
      sigtimedwait(&signals, nullptr, &ts);
    } else {
      int sig;
      sigwait(&signals, &sig);
    }
    coordinator.shutdown();
  } catch (const CoordinatorException& e) {
    LOG(ERROR) << e.what();
    return 2;
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << e.what();
    usage(argv[0]);
    return 1;
  }
  return 0;
}
