/*
 * 설명: 구조화 로그와 요청/DB 재시도 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "planner/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace planner {

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementConnectAttempt() { connect_attempts_.fetch_add(1); }

void Observability::IncrementReconnect() { reconnects_.fetch_add(1); }

void Observability::IncrementRetry() { retries_.fetch_add(1); }

void Observability::IncrementTransientFailure() { transient_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.connect_attempts = connect_attempts_.load();
  snapshot.reconnects = reconnects_.load();
  snapshot.retries = retries_.load();
  snapshot.transient_failures = transient_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (quiet_) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::Debug(const LogContext& ctx) const {
  if (verbose_) {
    Log(ctx);
  }
}

}  // namespace planner
