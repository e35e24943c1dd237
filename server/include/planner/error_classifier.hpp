/*
 * 설명: 실패를 일시(재시도 대상)/영구(즉시 전파)로 분류한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/error_classifier_test.cpp
 */
#pragma once

#include <exception>
#include <string_view>

namespace planner {

enum class FailureClass { kTransient, kPermanent };

FailureClass ClassifyCode(unsigned int code, std::string_view message);
FailureClass Classify(const std::exception& error);

inline bool IsTransient(const std::exception& error) { return Classify(error) == FailureClass::kTransient; }

// 락 대기 타임아웃(1205)과 데드락(1213). 재시도 대상이지만 연결은 살아 있다.
bool IsLockContention(const std::exception& error);

}  // namespace planner
