/*
 * 설명: 읽기/쓰기 작업을 연결 획득과 함께 감싸 일시 오류 시 핸들을 버리고 전체를 재시도한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/retry_executor_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "planner/connection_supervisor.hpp"
#include "planner/observability.hpp"
#include "planner/retry_policy.hpp"
#include "planner/store.hpp"

namespace planner {

class RetryExecutor {
 public:
  RetryExecutor(std::shared_ptr<ConnectionSupervisor> supervisor, RetryPolicy policy,
                std::shared_ptr<Observability> observability, SleepFn sleep = RealSleep());

  void WithSessionRetry(const std::string& name, const std::function<void(StoreSession&)>& work) const;
  // work가 true를 돌려주면 커밋, false면 롤백한다. 예외 경로는 항상 롤백된다.
  bool ExecuteTransactionWithRetry(const std::string& name, const std::function<bool(StoreSession&)>& work) const;

  template <typename T>
  T Execute(const std::string& name, const std::function<T(StoreSession&)>& work) const {
    std::optional<T> result;
    WithSessionRetry(name, [&](StoreSession& session) { result = work(session); });
    return std::move(*result);
  }

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

 private:
  std::shared_ptr<ConnectionSupervisor> supervisor_;
  RetryPolicy policy_;
  std::shared_ptr<Observability> observability_;
  SleepFn sleep_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace planner
