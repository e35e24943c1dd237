/*
 * 설명: 구조화 로그와 요청/DB 재시도 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_supervisor_test.cpp, server/tests/unit/api_router_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace planner {

struct LogContext {
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  std::optional<std::int64_t> user_id;
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t connect_attempts{0};
  std::uint64_t reconnects{0};
  std::uint64_t retries{0};
  std::uint64_t transient_failures{0};
};

class Observability {
 public:
  explicit Observability(bool verbose = false) : verbose_(verbose) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementConnectAttempt();
  void IncrementReconnect();
  void IncrementRetry();
  void IncrementTransientFailure();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  // LOG_LEVEL=debug일 때만 출력한다.
  void Debug(const LogContext& ctx) const;
  void SetQuiet(bool quiet) { quiet_ = quiet; }

 private:
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> connect_attempts_{0};
  std::atomic<std::uint64_t> reconnects_{0};
  std::atomic<std::uint64_t> retries_{0};
  std::atomic<std::uint64_t> transient_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  bool verbose_;
  std::atomic<bool> quiet_{false};
};

}  // namespace planner
