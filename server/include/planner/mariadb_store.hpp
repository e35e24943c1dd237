/*
 * 설명: MariaDB Connector/C 기반 연결 풀과 세션(행 단위 연산) 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_schedule_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "planner/store.hpp"

namespace planner {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  std::size_t pool_size{10};
  unsigned int connect_timeout_seconds{30};
  unsigned int query_timeout_seconds{30};
};

class MariaDbPool : public StorePool, public std::enable_shared_from_this<MariaDbPool> {
 public:
  // 첫 연결을 맺어 검증한 풀을 돌려준다. 실패하면 타입별 예외를 던진다.
  static std::shared_ptr<MariaDbPool> Open(const DbConfig& config);

  explicit MariaDbPool(const DbConfig& config);
  ~MariaDbPool() override;

  bool IsConnected() const override;
  std::unique_ptr<StoreSession> Lease() override;
  void Close() noexcept override;
  std::string Target() const override;

  void Release(MYSQL* conn, bool healthy);
  void MarkDisconnected();

 private:
  MYSQL* Connect() const;

  DbConfig config_;
  mutable std::mutex mutex_;
  std::vector<MYSQL*> idle_;
  std::atomic<bool> connected_{false};
  bool closed_{false};
};

class MariaDbSession : public StoreSession {
 public:
  MariaDbSession(std::shared_ptr<MariaDbPool> pool, MYSQL* conn);
  ~MariaDbSession() override;

  void Begin() override;
  void Commit() override;
  void Rollback() noexcept override;
  void Ping() override;
  void EnsureSchema() override;

  std::optional<RowId> FindUserIdByEmail(const std::string& email) override;
  std::optional<UserRecord> FindUserById(RowId user_id) override;
  RowId InsertUser(const NewUser& user) override;
  std::optional<UserCredentials> FindCredentials(const std::string& email) override;
  void TouchLastLogin(RowId user_id) override;

  std::optional<CourseRecord> FindCourseByCode(const std::string& course_code) override;
  std::optional<CourseRecord> FindCourseById(RowId course_id) override;
  RowId InsertCourse(const CourseInput& course) override;
  CoursePage ListCourses(const CourseFilter& filter) override;

  RowId InsertSchedule(RowId user_id, const std::string& name, int total_credits) override;
  bool UpdateScheduleHeader(RowId schedule_id, const std::optional<std::string>& name, int total_credits) override;
  void InsertScheduleEntry(RowId schedule_id, RowId course_id) override;
  void DeleteScheduleEntries(RowId schedule_id) override;
  bool DeleteSchedule(RowId schedule_id) override;
  std::optional<ScheduleRecord> FindSchedule(RowId schedule_id) override;
  std::vector<ScheduledCourse> ListScheduleCourses(RowId schedule_id) override;
  std::vector<ScheduleSummary> ListSchedulesForUser(RowId user_id) override;

 private:
  void Exec(const std::string& sql, const std::string& ctx);
  MYSQL_RES* Query(const std::string& sql, const std::string& ctx);
  std::optional<CourseRecord> FindCourseWhere(const std::string& where, const std::string& ctx);
  std::string Escape(const std::string& value) const;
  std::string Quote(const std::optional<std::string>& value) const;
  [[noreturn]] void RaiseError(const std::string& ctx);

  std::shared_ptr<MariaDbPool> pool_;
  MYSQL* conn_;
  bool in_transaction_{false};
  bool broken_{false};
};

}  // namespace planner
