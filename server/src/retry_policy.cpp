/*
 * 설명: 지수 백오프 지연 계산과 기본 sleep 함수.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "planner/retry_policy.hpp"

#include <algorithm>
#include <thread>

namespace planner {

std::chrono::milliseconds RetryPolicy::Next(std::chrono::milliseconds delay) const {
  auto scaled = std::chrono::milliseconds(static_cast<long long>(static_cast<double>(delay.count()) * multiplier));
  return std::min(scaled, max_delay);
}

SleepFn RealSleep() {
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

}  // namespace planner
