/*
 * 설명: 범위 기반 트랜잭션 가드. 커밋되지 않은 모든 종료 경로에서 롤백한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/schedule_service_test.cpp
 */
#include "planner/store.hpp"

namespace planner {

TransactionGuard::TransactionGuard(StoreSession& session) : session_(session) { session_.Begin(); }

TransactionGuard::~TransactionGuard() {
  if (!committed_) {
    session_.Rollback();
  }
}

void TransactionGuard::Commit() {
  session_.Commit();
  committed_ = true;
}

}  // namespace planner
