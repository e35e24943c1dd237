/*
 * 설명: 오류 코드와 메시지 패턴으로 일시/영구 실패를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/error_classifier_test.cpp
 */
#include "planner/error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include "planner/errors.hpp"

namespace planner {
namespace {
constexpr std::array<unsigned int, 11> kTransientCodes = {
    2002,  // CR_CONNECTION_ERROR
    2003,  // CR_CONN_HOST_ERROR
    2005,  // CR_UNKNOWN_HOST
    2006,  // CR_SERVER_GONE_ERROR
    2013,  // CR_SERVER_LOST
    2055,  // CR_SERVER_LOST_EXTENDED
    1040,  // ER_CON_COUNT_ERROR
    1053,  // ER_SERVER_SHUTDOWN
    1205,  // ER_LOCK_WAIT_TIMEOUT
    1213,  // ER_LOCK_DEADLOCK
    1927,  // ER_CONNECTION_KILLED
};

constexpr std::array<const char*, 21> kTransientPatterns = {
    "econnrefused",
    "econnreset",
    "etimedout",
    "esocket",
    "enotopen",
    "enetunreach",
    "connection lost",
    "connection is closed",
    "socket hang up",
    "is not currently available",
    "is in paused",
    "database is paused",
    "database is resuming",
    "cannot open server",
    "server is not found or not accessible",
    "network-related",
    "timed out",
    "timeout",
    "lost connection",
    "server has gone away",
    "can't connect",
};

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kDeadlock = 1213;
}  // namespace

FailureClass ClassifyCode(unsigned int code, std::string_view message) {
  if (std::find(kTransientCodes.begin(), kTransientCodes.end(), code) != kTransientCodes.end()) {
    return FailureClass::kTransient;
  }
  auto lowered = ToLower(message);
  for (const char* pattern : kTransientPatterns) {
    if (lowered.find(pattern) != std::string::npos) {
      return FailureClass::kTransient;
    }
  }
  return FailureClass::kPermanent;
}

FailureClass Classify(const std::exception& error) {
  if (dynamic_cast<const TransientConnectivityError*>(&error)) {
    return FailureClass::kTransient;
  }
  if (auto* conn = dynamic_cast<const ConnectionError*>(&error)) {
    return conn->transient_cause ? FailureClass::kTransient : FailureClass::kPermanent;
  }
  if (dynamic_cast<const ValidationError*>(&error) || dynamic_cast<const ConstraintViolation*>(&error) ||
      dynamic_cast<const NotFoundError*>(&error) || dynamic_cast<const PersistenceError*>(&error)) {
    return FailureClass::kPermanent;
  }
  if (auto* store = dynamic_cast<const StoreError*>(&error)) {
    return ClassifyCode(store->code, store->what());
  }
  return ClassifyCode(0, error.what());
}

bool IsLockContention(const std::exception& error) {
  if (auto* store = dynamic_cast<const StoreError*>(&error)) {
    if (store->code == kLockWaitTimeout || store->code == kDeadlock) {
      return true;
    }
  }
  auto lowered = ToLower(error.what());
  return lowered.find("deadlock") != std::string::npos || lowered.find("lock wait timeout") != std::string::npos;
}

}  // namespace planner
