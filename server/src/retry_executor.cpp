/*
 * 설명: 연결 획득 + 작업 전체를 하나의 재시도 단위로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/retry_executor_test.cpp
 */
#include "planner/retry_executor.hpp"

#include <algorithm>
#include <utility>

#include "planner/error_classifier.hpp"
#include "planner/errors.hpp"

namespace planner {
namespace {
constexpr unsigned int kInjectedCode = 2013;
}  // namespace

RetryExecutor::RetryExecutor(std::shared_ptr<ConnectionSupervisor> supervisor, RetryPolicy policy,
                             std::shared_ptr<Observability> observability, SleepFn sleep)
    : supervisor_(std::move(supervisor)), policy_(policy), observability_(std::move(observability)),
      sleep_(std::move(sleep)) {}

void RetryExecutor::WithSessionRetry(const std::string& name, const std::function<void(StoreSession&)>& work) const {
  const std::size_t max_attempts = std::max<std::size_t>(1, policy_.max_attempts);
  auto delay = policy_.initial_delay;
  for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    std::shared_ptr<StorePool> pool;
    try {
      pool = supervisor_->Acquire();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw TransientConnectivityError("주입된 일시 오류", kInjectedCode);
      }
      auto session = pool->Lease();
      work(*session);
      return;
    } catch (const std::exception& ex) {
      if (!IsTransient(ex)) {
        throw;
      }
      if (observability_) {
        observability_->IncrementTransientFailure();
      }
      // 다음 시도가 죽은 핸들을 재사용하지 않도록 버린다. 락 경합은 연결이 멀쩡하므로 유지한다.
      if (!(pool && pool->IsConnected() && IsLockContention(ex))) {
        supervisor_->Invalidate(pool);
      }
      if (attempt >= max_attempts) {
        if (observability_) {
          observability_->Log(LogContext{"", "db.retry.exhausted", 0, std::nullopt,
                                         {{"operation", name}, {"attempts", attempt}, {"message", ex.what()}}});
        }
        throw;
      }
      if (observability_) {
        observability_->IncrementRetry();
        observability_->Log(LogContext{"", "db.retry", 0, std::nullopt,
                                       {{"operation", name},
                                        {"attempt", attempt},
                                        {"delayMs", delay.count()},
                                        {"message", ex.what()}}});
      }
      sleep_(delay);
      delay = policy_.Next(delay);
    }
  }
}

bool RetryExecutor::ExecuteTransactionWithRetry(const std::string& name,
                                                const std::function<bool(StoreSession&)>& work) const {
  bool committed = false;
  WithSessionRetry(name, [&](StoreSession& session) {
    TransactionGuard tx(session);
    bool commit = work(session);
    if (commit) {
      tx.Commit();
    }
    committed = commit;
  });
  return committed;
}

void RetryExecutor::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace planner
