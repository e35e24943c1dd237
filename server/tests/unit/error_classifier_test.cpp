#include <stdexcept>

#include <gtest/gtest.h>

#include "planner/error_classifier.hpp"
#include "planner/errors.hpp"

namespace {

using planner::Classify;
using planner::ClassifyCode;
using planner::FailureClass;

TEST(ErrorClassifierTest, ConnectionLevelCodesAreTransient) {
  EXPECT_EQ(ClassifyCode(2002, ""), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(2003, ""), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(2006, ""), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(2013, ""), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(1040, ""), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(1213, ""), FailureClass::kTransient);
}

TEST(ErrorClassifierTest, ConstraintAndSyntaxCodesArePermanent) {
  EXPECT_EQ(ClassifyCode(1062, "Duplicate entry 'a@b.c' for key 'email'"), FailureClass::kPermanent);
  EXPECT_EQ(ClassifyCode(1064, "You have an error in your SQL syntax"), FailureClass::kPermanent);
  EXPECT_EQ(ClassifyCode(1452, "a foreign key constraint fails"), FailureClass::kPermanent);
}

TEST(ErrorClassifierTest, PausedDatabaseMessagesAreTransient) {
  EXPECT_EQ(ClassifyCode(0, "Database is resuming, try again"), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(0, "Server is in paused state"), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(0, "connect ECONNREFUSED 10.0.0.4:3306"), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(0, "MySQL server has gone away"), FailureClass::kTransient);
  EXPECT_EQ(ClassifyCode(0, "Connection timed out"), FailureClass::kTransient);
}

TEST(ErrorClassifierTest, TypedErrorsClassifyByTypeFirst) {
  // 메시지에 timeout이 있어도 입력 오류는 재시도하지 않는다.
  EXPECT_EQ(Classify(planner::ValidationError("timeout 값이 올바르지 않습니다")), FailureClass::kPermanent);
  EXPECT_EQ(Classify(planner::ConstraintViolation("Duplicate entry", 1062)), FailureClass::kPermanent);
  EXPECT_EQ(Classify(planner::NotFoundError("없음")), FailureClass::kPermanent);
  EXPECT_EQ(Classify(planner::PersistenceError("lost connection", 2013)), FailureClass::kPermanent);
  EXPECT_EQ(Classify(planner::TransientConnectivityError("무엇이든")), FailureClass::kTransient);
}

TEST(ErrorClassifierTest, ConnectionErrorFollowsRecordedCause) {
  EXPECT_EQ(Classify(planner::ConnectionError("재시도 소진", 2003, true)), FailureClass::kTransient);
  EXPECT_EQ(Classify(planner::ConnectionError("Access denied for user", 1045, false)), FailureClass::kPermanent);
}

TEST(ErrorClassifierTest, UntypedExceptionsFallBackToMessage) {
  EXPECT_EQ(Classify(std::runtime_error("socket hang up")), FailureClass::kTransient);
  EXPECT_EQ(Classify(std::runtime_error("division by zero")), FailureClass::kPermanent);
}

TEST(ErrorClassifierTest, LockContentionIsSeparatedFromConnectionLoss) {
  EXPECT_TRUE(planner::IsLockContention(planner::TransientConnectivityError("Deadlock found", 1213)));
  EXPECT_TRUE(planner::IsLockContention(planner::TransientConnectivityError("Lock wait timeout exceeded", 1205)));
  EXPECT_TRUE(planner::IsLockContention(std::runtime_error("Lock wait timeout exceeded; try restarting transaction")));
  EXPECT_FALSE(planner::IsLockContention(planner::TransientConnectivityError("Lost connection", 2013)));
  EXPECT_FALSE(planner::IsLockContention(std::runtime_error("Connection timed out")));
}

}  // namespace
