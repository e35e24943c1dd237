/*
 * 설명: 저장소 계층이 호출자에게 전달하는 타입별 예외를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/error_classifier_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace planner {

class StoreError : public std::runtime_error {
 public:
  StoreError(const std::string& message, unsigned int code) : std::runtime_error(message), code(code) {}
  unsigned int code;
};

// 연결 불가, 타임아웃, 일시정지/재개 중인 DB 등 재시도로 해소될 수 있는 실패.
class TransientConnectivityError : public StoreError {
 public:
  explicit TransientConnectivityError(const std::string& message, unsigned int code = 0) : StoreError(message, code) {}
};

// ConnectionSupervisor가 재시도를 소진했거나 영구 오류로 연결에 실패했을 때.
class ConnectionError : public StoreError {
 public:
  ConnectionError(const std::string& message, unsigned int code, bool transient_cause)
      : StoreError(message, code), transient_cause(transient_cause) {}
  bool transient_cause;
};

class ValidationError : public StoreError {
 public:
  explicit ValidationError(const std::string& message) : StoreError(message, 0) {}
};

class ConstraintViolation : public StoreError {
 public:
  explicit ConstraintViolation(const std::string& message, unsigned int code = 0) : StoreError(message, code) {}
};

class NotFoundError : public StoreError {
 public:
  explicit NotFoundError(const std::string& message) : StoreError(message, 0) {}
};

class PersistenceError : public StoreError {
 public:
  explicit PersistenceError(const std::string& message, unsigned int code = 0) : StoreError(message, code) {}
};

}  // namespace planner
