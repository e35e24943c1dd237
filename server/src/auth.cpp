/*
 * 설명: 모의 인증 구현. 비밀번호는 PBKDF2-SHA256(salt:hash 16진)으로 users.password_hash에 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_service_test.cpp
 */
#include "planner/auth.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "planner/errors.hpp"

namespace planner {

namespace {
constexpr int kPbkdf2Iterations = 100000;

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    unsigned int byte;
    std::istringstream iss(hex.substr(i, 2));
    iss >> std::hex >> byte;
    if (iss.fail()) {
      return false;
    }
    out.push_back(static_cast<unsigned char>(byte));
  }
  return true;
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string Trim(const std::string& text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}
}  // namespace

RateLimiter::RateLimiter(std::size_t max_attempts, std::chrono::seconds window)
    : max_attempts_(max_attempts), window_(window) {}

bool RateLimiter::Allow(const std::string& key, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& bucket = buckets_[key];
  if (bucket.window_start.time_since_epoch().count() == 0) {
    bucket.window_start = now;
  }
  auto elapsed = now - bucket.window_start;
  if (elapsed > window_) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_attempts_) {
    return false;
  }
  ++bucket.count;
  return true;
}

AuthService::AuthService(const AuthConfig& config, std::shared_ptr<RetryExecutor> executor)
    : config_(config),
      executor_(std::move(executor)),
      rate_limiter_(config.login_max_attempts, config.login_window) {}

bool AuthService::IsValidEmail(const std::string& email) {
  auto at = email.find('@');
  if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos) {
    return false;
  }
  auto domain = email.substr(at + 1);
  auto dot = domain.find('.');
  return dot != std::string::npos && dot > 0 && dot + 1 < domain.size();
}

AuthUser AuthService::Register(const std::string& email, const std::string& password, const std::string& name,
                               const std::optional<std::string>& student_id) {
  auto normalized = Lower(Trim(email));
  if (!IsValidEmail(normalized)) {
    throw ValidationError("이메일 형식이 올바르지 않습니다");
  }
  if (password.size() < 6) {
    throw ValidationError("비밀번호는 6자 이상이어야 합니다");
  }
  if (Trim(name).empty()) {
    throw ValidationError("이름이 필요합니다");
  }

  auto salt_hex = RandomHex(16);
  NewUser user;
  user.email = normalized;
  user.name = Trim(name);
  user.student_id = student_id;
  user.role = UserRole::kStudent;
  user.password_hash = salt_hex + ":" + HashPassword(password, salt_hex);

  RowId user_id = 0;
  executor_->ExecuteTransactionWithRetry("auth.register", [&](StoreSession& session) {
    if (session.FindUserIdByEmail(normalized)) {
      throw ConstraintViolation("이미 가입된 이메일입니다", 1062);
    }
    user_id = session.InsertUser(user);
    return true;
  });
  return AuthUser{user_id, user.email, user.name, user.student_id, user.role};
}

std::optional<AuthSession> AuthService::Login(const std::string& email, const std::string& password,
                                              const std::string& ip, std::string& error_code,
                                              std::string& error_message) {
  auto now = std::chrono::system_clock::now();
  if (!rate_limiter_.Allow(ip, now)) {
    error_code = "rate_limited";
    error_message = "로그인 시도 제한을 초과했습니다";
    return std::nullopt;
  }

  auto normalized = Lower(Trim(email));
  auto credentials = executor_->Execute<std::optional<UserCredentials>>(
      "auth.login", [&](StoreSession& session) { return session.FindCredentials(normalized); });
  if (!credentials || !VerifyPassword(password, credentials->password_hash)) {
    error_code = "unauthorized";
    error_message = "자격 증명이 올바르지 않습니다";
    return std::nullopt;
  }
  RowId user_id = credentials->id;
  executor_->WithSessionRetry("auth.touch_login", [&](StoreSession& session) { session.TouchLastLogin(user_id); });

  AuthSession session;
  session.token = RandomHex(32);
  session.user = AuthUser{credentials->id, credentials->email, credentials->name, credentials->student_id,
                          credentials->role};
  session.expires_at = now + config_.token_ttl;

  std::lock_guard<std::mutex> lock(mutex_);
  CleanupExpired(now);
  sessions_[session.token] = session;
  return session;
}

bool AuthService::Logout(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(token) > 0;
}

std::optional<AuthSession> AuthService::ValidateToken(const std::string& token) {
  auto now = std::chrono::system_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(token);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  if (now > it->second.expires_at) {
    sessions_.erase(it);
    return std::nullopt;
  }
  return it->second;
}

std::string AuthService::HashPassword(const std::string& password, const std::string& salt_hex) const {
  std::vector<unsigned char> salt;
  if (!HexToBytes(salt_hex, salt)) {
    return {};
  }
  std::vector<unsigned char> output(32);
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), kPbkdf2Iterations, EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    throw std::runtime_error("비밀번호 해시 실패");
  }
  return BytesToHex(output.data(), output.size());
}

bool AuthService::VerifyPassword(const std::string& password, const std::string& stored) const {
  auto sep = stored.find(':');
  if (sep == std::string::npos) {
    return false;
  }
  auto expected = stored.substr(sep + 1);
  auto computed = HashPassword(password, stored.substr(0, sep));
  if (computed.empty() || computed.size() != expected.size()) {
    return false;
  }
  return CRYPTO_memcmp(computed.data(), expected.data(), computed.size()) == 0;
}

void AuthService::CleanupExpired(std::chrono::system_clock::time_point now) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now > it->second.expires_at) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace planner
