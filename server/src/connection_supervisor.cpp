/*
 * 설명: 공유 풀 핸들의 (재)연결을 하나로 합치고 연결 자체에 지수 백오프를 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_supervisor_test.cpp
 */
#include "planner/connection_supervisor.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "planner/error_classifier.hpp"
#include "planner/errors.hpp"

namespace planner {
namespace {
unsigned int CodeOf(const std::exception& ex) {
  if (auto* store = dynamic_cast<const StoreError*>(&ex)) {
    return store->code;
  }
  return 0;
}
}  // namespace

ConnectionSupervisor::ConnectionSupervisor(PoolFactory factory, RetryPolicy policy,
                                           std::shared_ptr<Observability> observability, SleepFn sleep,
                                           std::chrono::milliseconds acquire_timeout)
    : factory_(std::move(factory)), policy_(policy), observability_(std::move(observability)),
      sleep_(std::move(sleep)), acquire_timeout_(acquire_timeout) {}

ConnectionSupervisor::~ConnectionSupervisor() { Shutdown(); }

std::shared_ptr<StorePool> ConnectionSupervisor::Acquire() {
  std::shared_ptr<StorePool> stale;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (connecting_) {
      bool finished = connect_done_.wait_for(lock, acquire_timeout_, [this]() { return !connecting_; });
      if (!finished) {
        throw TransientConnectivityError("진행 중인 연결을 기다리다 시간 초과");
      }
    }
    if (pool_ && pool_->IsConnected()) {
      return pool_;
    }
    // 끊어졌다고 보고한 핸들은 재사용하지 않는다.
    if (pool_) {
      stale = std::move(pool_);
      pool_.reset();
    }
    connecting_ = true;
  }

  if (stale) {
    stale->Close();
    if (observability_) {
      observability_->Log(LogContext{"", "db.pool.invalidated", 0, std::nullopt,
                                     {{"target", stale->Target()}, {"reason", "disconnected"}}});
    }
  }

  try {
    auto fresh = ConnectWithRetry();
    std::lock_guard<std::mutex> lock(mutex_);
    pool_ = fresh;
    connecting_ = false;
    connect_done_.notify_all();
    return fresh;
  } catch (...) {
    std::lock_guard<std::mutex> lock(mutex_);
    connecting_ = false;
    connect_done_.notify_all();
    throw;
  }
}

std::shared_ptr<StorePool> ConnectionSupervisor::ConnectWithRetry() {
  const std::size_t max_attempts = std::max<std::size_t>(1, policy_.max_attempts);
  auto delay = policy_.initial_delay;
  for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (observability_) {
      observability_->IncrementConnectAttempt();
      observability_->Debug(LogContext{"", "db.connect.attempt", 0, std::nullopt,
                                       {{"attempt", attempt}, {"maxAttempts", max_attempts}}});
    }
    try {
      auto pool = factory_();
      if (!pool) {
        throw PersistenceError("풀 생성 결과가 비어 있음");
      }
      bool reconnect = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect = ever_connected_;
        ever_connected_ = true;
      }
      if (observability_) {
        if (reconnect) {
          observability_->IncrementReconnect();
        }
        observability_->Log(LogContext{"", "db.connect.ok", 0, std::nullopt,
                                       {{"target", pool->Target()}, {"attempt", attempt}, {"reconnect", reconnect}}});
      }
      return pool;
    } catch (const std::exception& ex) {
      bool transient = IsTransient(ex);
      if (observability_) {
        observability_->Log(LogContext{"", "db.connect.failed", 0, std::nullopt,
                                       {{"attempt", attempt}, {"transient", transient}, {"message", ex.what()}}});
      }
      if (!transient) {
        throw ConnectionError(std::string("연결 실패(영구 오류): ") + ex.what(), CodeOf(ex), false);
      }
      if (observability_) {
        observability_->IncrementTransientFailure();
      }
      if (attempt >= max_attempts) {
        throw ConnectionError("연결 재시도 " + std::to_string(max_attempts) + "회 모두 실패: " + ex.what(),
                              CodeOf(ex), true);
      }
      sleep_(delay);
      delay = policy_.Next(delay);
    }
  }
  throw ConnectionError("연결 재시도 루프 종료", 0, false);
}

void ConnectionSupervisor::Invalidate(const std::shared_ptr<StorePool>& stale) {
  if (!stale) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_ != stale) {
      return;
    }
    pool_.reset();
  }
  stale->Close();
  if (observability_) {
    observability_->Log(LogContext{"", "db.pool.invalidated", 0, std::nullopt,
                                   {{"target", stale->Target()}, {"reason", "transient failure"}}});
  }
}

void ConnectionSupervisor::Shutdown() {
  std::shared_ptr<StorePool> current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = std::move(pool_);
    pool_.reset();
  }
  if (current) {
    current->Close();
  }
}

bool ConnectionSupervisor::HasLiveHandle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_ && pool_->IsConnected();
}

}  // namespace planner
