/*
 * 설명: 이메일(자연키) 기준으로 사용자를 조회하고 없으면 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/user_resolver_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "planner/models.hpp"
#include "planner/retry_executor.hpp"
#include "planner/store.hpp"

namespace planner {

class UserResolver {
 public:
  explicit UserResolver(std::shared_ptr<RetryExecutor> executor);

  // email 또는 숫자 id를 받는다. 이메일을 도출할 수 없으면 ValidationError.
  RowId ResolveUser(const std::string& email_or_id, const UserHints& hints = {}) const;

  // 호출자의 트랜잭션 안에서 같은 연결로 조회/생성한다.
  RowId ResolveInSession(StoreSession& session, const std::string& email_or_id, const UserHints& hints) const;

  // 생성 없이 조회만 한다.
  std::optional<RowId> FindUserId(StoreSession& session, const std::string& email_or_id) const;

  static std::optional<std::string> DeriveEmail(const std::string& email_or_id, const UserHints& hints);
  // 앞뒤 공백을 제거한 뒤 양의 정수 id만 받는다.
  static std::optional<RowId> ParseUserId(const std::string& raw);

 private:
  std::shared_ptr<RetryExecutor> executor_;
};

}  // namespace planner
