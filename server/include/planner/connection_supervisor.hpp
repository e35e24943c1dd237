/*
 * 설명: 논리 DB 대상 하나에 대한 공유 풀 핸들을 소유하고 (재)연결을 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_supervisor_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

#include "planner/observability.hpp"
#include "planner/retry_policy.hpp"
#include "planner/store.hpp"

namespace planner {

class ConnectionSupervisor {
 public:
  ConnectionSupervisor(PoolFactory factory, RetryPolicy policy, std::shared_ptr<Observability> observability,
                       SleepFn sleep = RealSleep(),
                       std::chrono::milliseconds acquire_timeout = std::chrono::seconds(120));
  ~ConnectionSupervisor();

  ConnectionSupervisor(const ConnectionSupervisor&) = delete;
  ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

  // 연결된 핸들을 돌려준다. 다른 호출자가 연결 중이면 그 결과를 기다려 재사용한다.
  std::shared_ptr<StorePool> Acquire();
  // stale이 현재 핸들과 같을 때만 버린다. 그 사이 새로 연결된 핸들은 건드리지 않는다.
  void Invalidate(const std::shared_ptr<StorePool>& stale);
  void Shutdown();
  bool HasLiveHandle() const;

 private:
  std::shared_ptr<StorePool> ConnectWithRetry();

  PoolFactory factory_;
  RetryPolicy policy_;
  std::shared_ptr<Observability> observability_;
  SleepFn sleep_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable connect_done_;
  std::shared_ptr<StorePool> pool_;
  bool connecting_{false};
  bool ever_connected_{false};
};

}  // namespace planner
