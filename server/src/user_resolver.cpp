/*
 * 설명: 사용자 get-or-create. 동시 삽입으로 유니크 제약에 걸리면 한 번 다시 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/user_resolver_test.cpp
 */
#include "planner/user_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "planner/errors.hpp"

namespace planner {

namespace {
std::string Trim(const std::string& text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string LocalPart(const std::string& email) {
  auto at = email.find('@');
  return at == std::string::npos ? email : email.substr(0, at);
}
}  // namespace

UserResolver::UserResolver(std::shared_ptr<RetryExecutor> executor) : executor_(std::move(executor)) {}

RowId UserResolver::ResolveUser(const std::string& email_or_id, const UserHints& hints) const {
  // 재시도 전에 입력 오류를 먼저 걸러낸다.
  if (!DeriveEmail(email_or_id, hints) && !ParseUserId(email_or_id)) {
    throw ValidationError("사용자 이메일을 확인할 수 없습니다");
  }
  return executor_->Execute<RowId>("user.resolve", [&](StoreSession& session) {
    return ResolveInSession(session, email_or_id, hints);
  });
}

RowId UserResolver::ResolveInSession(StoreSession& session, const std::string& email_or_id,
                                     const UserHints& hints) const {
  auto email = DeriveEmail(email_or_id, hints);
  if (!email) {
    auto user_id = ParseUserId(email_or_id);
    if (!user_id) {
      throw ValidationError("사용자 이메일을 확인할 수 없습니다");
    }
    if (!session.FindUserById(*user_id)) {
      throw NotFoundError("사용자를 찾을 수 없습니다: " + std::to_string(*user_id));
    }
    return *user_id;
  }

  if (auto existing = session.FindUserIdByEmail(*email)) {
    return *existing;
  }

  NewUser user;
  user.email = *email;
  user.name = hints.name && !Trim(*hints.name).empty() ? Trim(*hints.name) : LocalPart(*email);
  user.student_id = hints.student_id;
  user.role = hints.role.value_or(UserRole::kStudent);
  try {
    return session.InsertUser(user);
  } catch (const ConstraintViolation&) {
    // 다른 요청이 먼저 같은 이메일을 넣었다. 그 행을 돌려준다.
    if (auto existing = session.FindUserIdByEmail(*email)) {
      return *existing;
    }
    throw;
  }
}

std::optional<RowId> UserResolver::FindUserId(StoreSession& session, const std::string& email_or_id) const {
  auto email = DeriveEmail(email_or_id, UserHints{});
  if (email) {
    return session.FindUserIdByEmail(*email);
  }
  auto user_id = ParseUserId(email_or_id);
  if (!user_id) {
    return std::nullopt;
  }
  if (!session.FindUserById(*user_id)) {
    return std::nullopt;
  }
  return user_id;
}

std::optional<std::string> UserResolver::DeriveEmail(const std::string& email_or_id, const UserHints& hints) {
  if (hints.email) {
    auto email = Lower(Trim(*hints.email));
    if (email.find('@') != std::string::npos && email.front() != '@') {
      return email;
    }
  }
  auto candidate = Lower(Trim(email_or_id));
  if (candidate.find('@') != std::string::npos && candidate.front() != '@') {
    return candidate;
  }
  return std::nullopt;
}

std::optional<RowId> UserResolver::ParseUserId(const std::string& raw) {
  const auto text = Trim(raw);
  if (text.empty() || text.size() > 18) {
    return std::nullopt;
  }
  if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  RowId value = std::stoll(text);
  if (value <= 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace planner
