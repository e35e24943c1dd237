/*
 * 설명: 모의 인증. 가입/로그인/토큰과 로그인 레이트리밋을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_service_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "planner/models.hpp"
#include "planner/retry_executor.hpp"

namespace planner {

struct AuthUser {
  RowId user_id;
  std::string email;
  std::string name;
  std::optional<std::string> student_id;
  UserRole role;
};

struct AuthSession {
  std::string token;
  AuthUser user;
  std::chrono::system_clock::time_point expires_at;
};

struct AuthConfig {
  std::chrono::seconds token_ttl{std::chrono::seconds(3600)};
  std::chrono::seconds login_window{std::chrono::seconds(60)};
  std::size_t login_max_attempts{5};
};

class RateLimiter {
 public:
  RateLimiter(std::size_t max_attempts, std::chrono::seconds window);
  bool Allow(const std::string& key, std::chrono::system_clock::time_point now);

 private:
  struct Bucket {
    std::size_t count{0};
    std::chrono::system_clock::time_point window_start{};
  };
  std::unordered_map<std::string, Bucket> buckets_;
  std::size_t max_attempts_;
  std::chrono::seconds window_;
  std::mutex mutex_;
};

class AuthService {
 public:
  AuthService(const AuthConfig& config, std::shared_ptr<RetryExecutor> executor);

  // 입력 오류는 ValidationError, 중복 이메일은 ConstraintViolation.
  AuthUser Register(const std::string& email, const std::string& password, const std::string& name,
                    const std::optional<std::string>& student_id);
  std::optional<AuthSession> Login(const std::string& email, const std::string& password, const std::string& ip,
                                   std::string& error_code, std::string& error_message);
  bool Logout(const std::string& token);
  std::optional<AuthSession> ValidateToken(const std::string& token);

  AuthConfig GetConfig() const { return config_; }

  static bool IsValidEmail(const std::string& email);

 private:
  std::string HashPassword(const std::string& password, const std::string& salt_hex) const;
  bool VerifyPassword(const std::string& password, const std::string& stored) const;
  void CleanupExpired(std::chrono::system_clock::time_point now);

  AuthConfig config_;
  std::shared_ptr<RetryExecutor> executor_;
  RateLimiter rate_limiter_;
  std::mutex mutex_;
  std::unordered_map<std::string, AuthSession> sessions_;
};

}  // namespace planner
