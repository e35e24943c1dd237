/*
 * 설명: 연결과 작업 재시도에 공통으로 쓰는 지수 백오프 정책.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_supervisor_test.cpp, server/tests/unit/retry_executor_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

namespace planner {

using SleepFn = std::function<void(std::chrono::milliseconds)>;

struct RetryPolicy {
  std::size_t max_attempts{5};
  std::chrono::milliseconds initial_delay{2000};
  double multiplier{2.0};
  std::chrono::milliseconds max_delay{30000};

  std::chrono::milliseconds Next(std::chrono::milliseconds delay) const;
};

SleepFn RealSleep();

}  // namespace planner
