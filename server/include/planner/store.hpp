/*
 * 설명: 연결 풀 핸들과 임대 세션(한 개의 연결) 인터페이스, 트랜잭션 가드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/schedule_service_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "planner/models.hpp"

namespace planner {

class StoreSession {
 public:
  virtual ~StoreSession() = default;

  virtual void Begin() = 0;
  virtual void Commit() = 0;
  virtual void Rollback() noexcept = 0;
  virtual void Ping() = 0;
  virtual void EnsureSchema() = 0;

  virtual std::optional<RowId> FindUserIdByEmail(const std::string& email) = 0;
  virtual std::optional<UserRecord> FindUserById(RowId user_id) = 0;
  virtual RowId InsertUser(const NewUser& user) = 0;
  virtual std::optional<UserCredentials> FindCredentials(const std::string& email) = 0;
  virtual void TouchLastLogin(RowId user_id) = 0;

  virtual std::optional<CourseRecord> FindCourseByCode(const std::string& course_code) = 0;
  virtual std::optional<CourseRecord> FindCourseById(RowId course_id) = 0;
  virtual RowId InsertCourse(const CourseInput& course) = 0;
  virtual CoursePage ListCourses(const CourseFilter& filter) = 0;

  virtual RowId InsertSchedule(RowId user_id, const std::string& name, int total_credits) = 0;
  virtual bool UpdateScheduleHeader(RowId schedule_id, const std::optional<std::string>& name,
                                    int total_credits) = 0;
  virtual void InsertScheduleEntry(RowId schedule_id, RowId course_id) = 0;
  virtual void DeleteScheduleEntries(RowId schedule_id) = 0;
  virtual bool DeleteSchedule(RowId schedule_id) = 0;
  virtual std::optional<ScheduleRecord> FindSchedule(RowId schedule_id) = 0;
  virtual std::vector<ScheduledCourse> ListScheduleCourses(RowId schedule_id) = 0;
  virtual std::vector<ScheduleSummary> ListSchedulesForUser(RowId user_id) = 0;
};

// 공유 풀 핸들. ConnectionSupervisor만 교체/무효화한다.
class StorePool {
 public:
  virtual ~StorePool() = default;

  virtual bool IsConnected() const = 0;
  virtual std::unique_ptr<StoreSession> Lease() = 0;
  virtual void Close() noexcept = 0;
  virtual std::string Target() const = 0;
};

using PoolFactory = std::function<std::shared_ptr<StorePool>()>;

class TransactionGuard {
 public:
  explicit TransactionGuard(StoreSession& session);
  ~TransactionGuard();

  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void Commit();
  bool Committed() const { return committed_; }

 private:
  StoreSession& session_;
  bool committed_{false};
};

}  // namespace planner
