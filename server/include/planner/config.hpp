/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "planner/auth.hpp"
#include "planner/mariadb_store.hpp"
#include "planner/retry_policy.hpp"

namespace planner {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::size_t db_pool_size;
  unsigned int db_connect_timeout_seconds;
  unsigned int db_query_timeout_seconds;
  std::size_t db_acquire_timeout_seconds;
  bool db_bootstrap_schema;
  std::size_t retry_max_attempts;
  std::size_t retry_initial_delay_ms;
  double retry_multiplier;
  std::size_t retry_max_delay_ms;
  std::size_t worker_threads;
  std::string log_level;
  std::size_t auth_token_ttl_seconds;
  std::size_t login_rate_window_seconds;
  std::size_t login_rate_limit_max;
  std::string cors_allow_origin;
};

AppConfig LoadConfigFromEnv();

DbConfig ToDbConfig(const AppConfig& config);
RetryPolicy ToRetryPolicy(const AppConfig& config);
AuthConfig ToAuthConfig(const AppConfig& config);

}  // namespace planner
