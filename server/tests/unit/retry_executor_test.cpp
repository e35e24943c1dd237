#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>

#include "planner/errors.hpp"
#include "service_harness.hpp"

namespace {

using planner_test::Permanent;
using planner_test::ServiceHarness;
using planner_test::Transient;

TEST(RetryExecutorTest, FewerTransientFailuresThanMaxAttemptsStillSucceed) {
  ServiceHarness h;
  // 4번 연속 일시 오류 뒤 5번째 시도에서 성공한다.
  h.db->FailOn("ping", Transient("Database is resuming"), 4);

  int calls = 0;
  auto result = h.executor->Execute<int>("test.ping", [&](planner::StoreSession& session) {
    ++calls;
    session.Ping();
    return 42;
  });

  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 5);
  EXPECT_EQ(h.retry_sleeps.delays.size(), 4u);
  EXPECT_EQ(h.observability->Snapshot().retries, 4u);
}

TEST(RetryExecutorTest, TransientFailureInvalidatesHandleBeforeRetry) {
  ServiceHarness h;
  h.db->FailOn("ping", Transient("Lost connection to server during query", 2013), 1);

  h.executor->WithSessionRetry("test.ping", [](planner::StoreSession& session) { session.Ping(); });

  // 첫 핸들이 버려지고 새 핸들로 재연결했다.
  EXPECT_EQ(h.db->OpenCount(), 2u);
  EXPECT_TRUE(h.supervisor->HasLiveHandle());
}

TEST(RetryExecutorTest, LockContentionRetriesOnSameHandle) {
  ServiceHarness h;
  h.db->FailOn("ping", Transient("Deadlock found when trying to get lock; try restarting transaction", 1213), 1);
  h.db->FailOn("find_course_by_id", Transient("Lock wait timeout exceeded; try restarting transaction", 1205), 1);

  h.executor->WithSessionRetry("test.ping", [](planner::StoreSession& session) { session.Ping(); });
  h.executor->WithSessionRetry("test.find", [](planner::StoreSession& session) { session.FindCourseById(1); });

  EXPECT_EQ(h.db->OpenCount(), 1u);
  EXPECT_EQ(h.retry_sleeps.delays.size(), 2u);
  EXPECT_TRUE(h.supervisor->HasLiveHandle());
}

TEST(RetryExecutorTest, PermanentFailureIsNotRetried) {
  ServiceHarness h;
  h.db->FailOn("ping", Permanent(), 5);

  int calls = 0;
  EXPECT_THROW(h.executor->WithSessionRetry("test.ping",
                                            [&](planner::StoreSession& session) {
                                              ++calls;
                                              session.Ping();
                                            }),
               planner::PersistenceError);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(h.retry_sleeps.delays.empty());
  EXPECT_EQ(h.db->OpenCount(), 1u);
}

TEST(RetryExecutorTest, ExhaustedRetriesSurfaceLastTransientError) {
  planner::RetryPolicy policy;
  policy.max_attempts = 3;
  ServiceHarness h(policy);
  h.db->FailOn("ping", Transient("server has gone away", 2006), 10);

  try {
    h.executor->WithSessionRetry("test.ping", [](planner::StoreSession& session) { session.Ping(); });
    FAIL() << "TransientConnectivityError가 발생해야 합니다";
  } catch (const planner::TransientConnectivityError& e) {
    EXPECT_EQ(e.code, 2006u);
  }
  EXPECT_EQ(h.db->CallCount("ping"), 3u);
  std::vector<std::chrono::milliseconds> expected{std::chrono::milliseconds(2000), std::chrono::milliseconds(4000)};
  EXPECT_EQ(h.retry_sleeps.delays, expected);
}

TEST(RetryExecutorTest, LeaseFailureCountsAsTransient) {
  ServiceHarness h;
  h.db->FailOn("lease", Transient("connection is closed", 2006), 2);

  h.executor->WithSessionRetry("test.ping", [](planner::StoreSession& session) { session.Ping(); });
  EXPECT_EQ(h.db->CallCount("ping"), 1u);
  EXPECT_EQ(h.db->OpenCount(), 3u);
}

TEST(RetryExecutorTest, InjectorForcesTransientAttempts) {
  ServiceHarness h;
  h.executor->SetTransientInjector([](std::size_t attempt) { return attempt < 3; });

  int calls = 0;
  h.executor->WithSessionRetry("test.injected", [&](planner::StoreSession&) { ++calls; });
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(h.retry_sleeps.delays.size(), 2u);
}

TEST(RetryExecutorTest, TransactionRollsBackWhenWorkThrows) {
  ServiceHarness h;

  EXPECT_THROW(h.executor->ExecuteTransactionWithRetry("test.tx",
                                                       [](planner::StoreSession& session) -> bool {
                                                         planner::NewUser user;
                                                         user.email = "tx@example.com";
                                                         user.name = "tx";
                                                         session.InsertUser(user);
                                                         throw std::logic_error("중간 실패");
                                                       }),
               std::logic_error);
  EXPECT_EQ(h.db->UserCount(), 0u);
  EXPECT_EQ(h.db->BeginCount(), 1u);
  EXPECT_EQ(h.db->RollbackCount(), 1u);
  EXPECT_EQ(h.db->CommitCount(), 0u);
}

TEST(RetryExecutorTest, TransactionReturningFalseRollsBack) {
  ServiceHarness h;

  bool committed = h.executor->ExecuteTransactionWithRetry("test.tx", [](planner::StoreSession& session) {
    planner::NewUser user;
    user.email = "undo@example.com";
    user.name = "undo";
    session.InsertUser(user);
    return false;
  });
  EXPECT_FALSE(committed);
  EXPECT_EQ(h.db->UserCount(), 0u);
  EXPECT_EQ(h.db->RollbackCount(), 1u);
}

TEST(RetryExecutorTest, CommitFailureRetriesWholeTransaction) {
  ServiceHarness h;
  h.db->FailOn("commit", Transient("Lost connection to server during query", 2013), 1);

  int calls = 0;
  h.executor->ExecuteTransactionWithRetry("test.tx", [&](planner::StoreSession& session) {
    ++calls;
    planner::NewUser user;
    user.email = "commit@example.com";
    user.name = "commit";
    session.InsertUser(user);
    return true;
  });
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(h.db->UserCount(), 1u);
  EXPECT_EQ(h.db->RollbackCount(), 1u);
}

}  // namespace
