/*
 * 설명: MariaDB 연결 풀, 트랜잭션 제어, 사용자/과목/시간표 행 연산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_schedule_it_test.cpp
 */
#include "planner/mariadb_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include <mariadb/errmsg.h>

#include "planner/error_classifier.hpp"
#include "planner/errors.hpp"

namespace planner {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
constexpr unsigned int kRowIsReferenced = 1451;
constexpr unsigned int kNoReferencedRow = 1452;
constexpr unsigned int kServerShutdown = 1053;
constexpr unsigned int kConnectionKilled = 1927;

constexpr const char* kCourseColumns =
    "id, course_code, name, credits, instructor, time_slot, room, weeks, capacity, created_at";

using ResultPtr = std::unique_ptr<MYSQL_RES, void (*)(MYSQL_RES*)>;

int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
RowId ToRowId(const char* value) { return value ? static_cast<RowId>(std::stoll(value)) : 0; }
std::optional<std::string> ToOptString(const char* value) {
  return value ? std::optional<std::string>(value) : std::nullopt;
}
std::optional<int> ToOptInt(const char* value) { return value ? std::optional<int>(std::stoi(value)) : std::nullopt; }

std::chrono::system_clock::time_point ParseTimestamp(const char* text) {
  std::tm tm{};
  std::istringstream iss(text ? text : "1970-01-01 00:00:00");
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

bool IsConnectionLoss(unsigned int code) {
  return code == CR_SERVER_GONE_ERROR || code == CR_SERVER_LOST || code == CR_SERVER_LOST_EXTENDED ||
         code == CR_CONNECTION_ERROR || code == CR_CONN_HOST_ERROR || code == kServerShutdown ||
         code == kConnectionKilled;
}

[[noreturn]] void ThrowStoreError(unsigned int code, const std::string& message) {
  if (code == kDuplicateEntry || code == kRowIsReferenced || code == kNoReferencedRow) {
    throw ConstraintViolation(message, code);
  }
  if (ClassifyCode(code, message) == FailureClass::kTransient) {
    throw TransientConnectivityError(message, code);
  }
  throw PersistenceError(message, code);
}

CourseRecord BuildCourse(MYSQL_ROW row) {
  return CourseRecord{ToRowId(row[0]),
                      row[1] ? row[1] : "",
                      row[2] ? row[2] : "",
                      ToInt(row[3]),
                      ToOptString(row[4]),
                      ToOptString(row[5]),
                      ToOptString(row[6]),
                      ToOptString(row[7]),
                      ToOptInt(row[8]),
                      ParseTimestamp(row[9])};
}

const char* kSchemaStatements[] = {
    "CREATE TABLE IF NOT EXISTS users ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " email VARCHAR(255) NOT NULL,"
    " name VARCHAR(255) NOT NULL,"
    " student_id VARCHAR(50) NULL,"
    " role VARCHAR(16) NOT NULL DEFAULT 'student',"
    " password_hash VARCHAR(255) NULL,"
    " created_at DATETIME(6) NOT NULL,"
    " updated_at DATETIME(6) NOT NULL,"
    " last_login_at DATETIME(6) NULL,"
    " UNIQUE KEY uq_users_email (email)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
    "CREATE TABLE IF NOT EXISTS courses ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " course_code VARCHAR(50) NOT NULL,"
    " name VARCHAR(255) NOT NULL,"
    " credits INT NOT NULL DEFAULT 0,"
    " instructor VARCHAR(255) NULL,"
    " time_slot VARCHAR(100) NULL,"
    " room VARCHAR(50) NULL,"
    " weeks VARCHAR(100) NULL,"
    " capacity INT NULL,"
    " created_at DATETIME(6) NOT NULL,"
    " UNIQUE KEY uq_courses_code (course_code),"
    " CHECK (credits >= 0)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
    "CREATE TABLE IF NOT EXISTS schedules ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " user_id BIGINT NOT NULL,"
    " name VARCHAR(255) NOT NULL,"
    " total_credits INT NOT NULL DEFAULT 0,"
    " created_at DATETIME(6) NOT NULL,"
    " updated_at DATETIME(6) NOT NULL,"
    " KEY ix_schedules_user (user_id, created_at),"
    " CONSTRAINT fk_schedules_user FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
    "CREATE TABLE IF NOT EXISTS schedule_entries ("
    " schedule_id BIGINT NOT NULL,"
    " course_id BIGINT NOT NULL,"
    " created_at DATETIME(6) NOT NULL,"
    " PRIMARY KEY (schedule_id, course_id),"
    " CONSTRAINT fk_entries_schedule FOREIGN KEY (schedule_id) REFERENCES schedules(id) ON DELETE CASCADE,"
    " CONSTRAINT fk_entries_course FOREIGN KEY (course_id) REFERENCES courses(id) ON DELETE CASCADE"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
};
}  // namespace

MariaDbPool::MariaDbPool(const DbConfig& config) : config_(config) {}

MariaDbPool::~MariaDbPool() { Close(); }

std::shared_ptr<MariaDbPool> MariaDbPool::Open(const DbConfig& config) {
  auto pool = std::make_shared<MariaDbPool>(config);
  MYSQL* conn = pool->Connect();
  {
    std::lock_guard<std::mutex> lock(pool->mutex_);
    pool->idle_.push_back(conn);
  }
  pool->connected_ = true;
  return pool;
}

MYSQL* MariaDbPool::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw TransientConnectivityError("MariaDB 초기화 실패");
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout_seconds);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("연결 실패: ") + mysql_error(conn);
    mysql_close(conn);
    ThrowStoreError(code, message);
  }
  if (mysql_query(conn, "SET SESSION innodb_lock_wait_timeout=10, sql_mode='STRICT_TRANS_TABLES,NO_ENGINE_SUBSTITUTION';") != 0) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("세션 설정 실패: ") + mysql_error(conn);
    mysql_close(conn);
    ThrowStoreError(code, message);
  }
  return conn;
}

bool MariaDbPool::IsConnected() const { return connected_.load(); }

std::unique_ptr<StoreSession> MariaDbPool::Lease() {
  MYSQL* conn = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !connected_) {
      throw TransientConnectivityError("풀 연결이 끊어짐", CR_SERVER_GONE_ERROR);
    }
    if (!idle_.empty()) {
      conn = idle_.back();
      idle_.pop_back();
    }
  }
  if (!conn) {
    try {
      conn = Connect();
    } catch (const TransientConnectivityError&) {
      MarkDisconnected();
      throw;
    }
  }
  return std::make_unique<MariaDbSession>(shared_from_this(), conn);
}

void MariaDbPool::Release(MYSQL* conn, bool healthy) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (healthy && !closed_ && connected_ && idle_.size() < config_.pool_size) {
      idle_.push_back(conn);
      return;
    }
  }
  mysql_close(conn);
}

void MariaDbPool::MarkDisconnected() { connected_ = false; }

void MariaDbPool::Close() noexcept {
  std::vector<MYSQL*> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle.swap(idle_);
  }
  connected_ = false;
  for (MYSQL* conn : idle) {
    mysql_close(conn);
  }
}

std::string MariaDbPool::Target() const {
  std::ostringstream oss;
  oss << config_.host << ":" << config_.port << "/" << config_.database;
  return oss.str();
}

MariaDbSession::MariaDbSession(std::shared_ptr<MariaDbPool> pool, MYSQL* conn) : pool_(std::move(pool)), conn_(conn) {}

MariaDbSession::~MariaDbSession() {
  if (in_transaction_) {
    Rollback();
  }
  pool_->Release(conn_, !broken_);
}

void MariaDbSession::Begin() {
  if (mysql_autocommit(conn_, 0) != 0) {
    RaiseError("트랜잭션 시작 실패");
  }
  in_transaction_ = true;
}

void MariaDbSession::Commit() {
  if (mysql_commit(conn_) != 0) {
    RaiseError("커밋 실패");
  }
  in_transaction_ = false;
  if (mysql_autocommit(conn_, 1) != 0) {
    RaiseError("autocommit 복원 실패");
  }
}

void MariaDbSession::Rollback() noexcept {
  in_transaction_ = false;
  if (mysql_rollback(conn_) != 0 || mysql_autocommit(conn_, 1) != 0) {
    // 상태를 알 수 없는 연결은 풀로 돌려보내지 않는다.
    broken_ = true;
    if (IsConnectionLoss(mysql_errno(conn_))) {
      pool_->MarkDisconnected();
    }
  }
}

void MariaDbSession::Ping() {
  if (mysql_ping(conn_) != 0) {
    RaiseError("핑 실패");
  }
}

void MariaDbSession::EnsureSchema() {
  for (const char* statement : kSchemaStatements) {
    Exec(statement, "스키마 생성 실패");
  }
}

std::optional<RowId> MariaDbSession::FindUserIdByEmail(const std::string& email) {
  std::ostringstream oss;
  oss << "SELECT id FROM users WHERE email='" << Escape(email) << "' LOCK IN SHARE MODE;";
  ResultPtr res(Query(oss.str(), "사용자 조회 실패"), mysql_free_result);
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  return ToRowId(row[0]);
}

std::optional<UserRecord> MariaDbSession::FindUserById(RowId user_id) {
  std::ostringstream oss;
  oss << "SELECT id, email, name, student_id, role, created_at, updated_at FROM users WHERE id=" << user_id << ";";
  ResultPtr res(Query(oss.str(), "사용자 조회 실패"), mysql_free_result);
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  return UserRecord{ToRowId(row[0]),
                    row[1] ? row[1] : "",
                    row[2] ? row[2] : "",
                    ToOptString(row[3]),
                    ParseRole(row[4] ? row[4] : "").value_or(UserRole::kStudent),
                    ParseTimestamp(row[5]),
                    ParseTimestamp(row[6])};
}

RowId MariaDbSession::InsertUser(const NewUser& user) {
  std::ostringstream oss;
  oss << "INSERT INTO users(email, name, student_id, role, password_hash, created_at, updated_at) VALUES('"
      << Escape(user.email) << "', '" << Escape(user.name) << "', " << Quote(user.student_id) << ", '"
      << ToString(user.role) << "', " << Quote(user.password_hash) << ", UTC_TIMESTAMP(6), UTC_TIMESTAMP(6));";
  Exec(oss.str(), "사용자 생성 실패");
  return static_cast<RowId>(mysql_insert_id(conn_));
}

std::optional<UserCredentials> MariaDbSession::FindCredentials(const std::string& email) {
  std::ostringstream oss;
  oss << "SELECT id, email, name, student_id, role, password_hash FROM users WHERE email='" << Escape(email) << "';";
  ResultPtr res(Query(oss.str(), "자격 증명 조회 실패"), mysql_free_result);
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  return UserCredentials{ToRowId(row[0]),
                         row[1] ? row[1] : "",
                         row[2] ? row[2] : "",
                         ToOptString(row[3]),
                         ParseRole(row[4] ? row[4] : "").value_or(UserRole::kStudent),
                         row[5] ? row[5] : ""};
}

void MariaDbSession::TouchLastLogin(RowId user_id) {
  std::ostringstream oss;
  oss << "UPDATE users SET last_login_at=UTC_TIMESTAMP(6) WHERE id=" << user_id << ";";
  Exec(oss.str(), "마지막 로그인 갱신 실패");
}

std::optional<CourseRecord> MariaDbSession::FindCourseWhere(const std::string& where, const std::string& ctx) {
  std::ostringstream oss;
  oss << "SELECT " << kCourseColumns << " FROM courses WHERE " << where << ";";
  ResultPtr res(Query(oss.str(), ctx), mysql_free_result);
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  return BuildCourse(row);
}

std::optional<CourseRecord> MariaDbSession::FindCourseByCode(const std::string& course_code) {
  return FindCourseWhere("course_code='" + Escape(course_code) + "' LOCK IN SHARE MODE", "과목 코드 조회 실패");
}

std::optional<CourseRecord> MariaDbSession::FindCourseById(RowId course_id) {
  return FindCourseWhere("id=" + std::to_string(course_id), "과목 조회 실패");
}

RowId MariaDbSession::InsertCourse(const CourseInput& course) {
  std::ostringstream oss;
  oss << "INSERT INTO courses(course_code, name, credits, instructor, time_slot, room, weeks, capacity, created_at) "
         "VALUES('"
      << Escape(course.course_code) << "', '" << Escape(course.name) << "', " << course.credits << ", "
      << Quote(course.instructor) << ", " << Quote(course.time) << ", " << Quote(course.room) << ", "
      << Quote(course.weeks) << ", " << (course.capacity ? std::to_string(*course.capacity) : std::string("NULL"))
      << ", UTC_TIMESTAMP(6));";
  Exec(oss.str(), "과목 생성 실패");
  return static_cast<RowId>(mysql_insert_id(conn_));
}

CoursePage MariaDbSession::ListCourses(const CourseFilter& filter) {
  std::string where = "1=1";
  if (!filter.query.empty()) {
    std::string pattern;
    for (char c : Escape(filter.query)) {
      if (c == '%' || c == '_') {
        pattern.push_back('\\');
      }
      pattern.push_back(c);
    }
    where = "(course_code LIKE '%" + pattern + "%' OR name LIKE '%" + pattern + "%')";
  }

  CoursePage page{0, {}};
  std::ostringstream count_sql;
  count_sql << "SELECT COUNT(*) FROM courses WHERE " << where << ";";
  {
    ResultPtr res(Query(count_sql.str(), "과목 카운트 실패"), mysql_free_result);
    MYSQL_ROW row = mysql_fetch_row(res.get());
    page.total = row && row[0] ? static_cast<std::size_t>(std::stoull(row[0])) : 0;
  }

  std::size_t offset = (filter.page - 1) * filter.size;
  std::ostringstream query_sql;
  query_sql << "SELECT " << kCourseColumns << " FROM courses WHERE " << where << " ORDER BY name ASC, id ASC LIMIT "
            << filter.size << " OFFSET " << offset << ";";
  ResultPtr res(Query(query_sql.str(), "과목 목록 조회 실패"), mysql_free_result);
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    page.entries.push_back(BuildCourse(row));
  }
  return page;
}

RowId MariaDbSession::InsertSchedule(RowId user_id, const std::string& name, int total_credits) {
  std::ostringstream oss;
  oss << "INSERT INTO schedules(user_id, name, total_credits, created_at, updated_at) VALUES(" << user_id << ", '"
      << Escape(name) << "', " << total_credits << ", UTC_TIMESTAMP(6), UTC_TIMESTAMP(6));";
  Exec(oss.str(), "시간표 생성 실패");
  return static_cast<RowId>(mysql_insert_id(conn_));
}

bool MariaDbSession::UpdateScheduleHeader(RowId schedule_id, const std::optional<std::string>& name,
                                          int total_credits) {
  std::ostringstream oss;
  oss << "UPDATE schedules SET ";
  if (name) {
    oss << "name='" << Escape(*name) << "', ";
  }
  oss << "total_credits=" << total_credits << ", updated_at=UTC_TIMESTAMP(6) WHERE id=" << schedule_id << ";";
  Exec(oss.str(), "시간표 갱신 실패");
  return mysql_affected_rows(conn_) > 0;
}

void MariaDbSession::InsertScheduleEntry(RowId schedule_id, RowId course_id) {
  std::ostringstream oss;
  oss << "INSERT INTO schedule_entries(schedule_id, course_id, created_at) VALUES(" << schedule_id << ", "
      << course_id << ", UTC_TIMESTAMP(6));";
  Exec(oss.str(), "시간표 항목 저장 실패");
}

void MariaDbSession::DeleteScheduleEntries(RowId schedule_id) {
  std::ostringstream oss;
  oss << "DELETE FROM schedule_entries WHERE schedule_id=" << schedule_id << ";";
  Exec(oss.str(), "시간표 항목 삭제 실패");
}

bool MariaDbSession::DeleteSchedule(RowId schedule_id) {
  std::ostringstream oss;
  oss << "DELETE FROM schedules WHERE id=" << schedule_id << ";";
  Exec(oss.str(), "시간표 삭제 실패");
  return mysql_affected_rows(conn_) > 0;
}

std::optional<ScheduleRecord> MariaDbSession::FindSchedule(RowId schedule_id) {
  std::ostringstream oss;
  oss << "SELECT id, user_id, name, total_credits, created_at, updated_at FROM schedules WHERE id=" << schedule_id
      << ";";
  ResultPtr res(Query(oss.str(), "시간표 조회 실패"), mysql_free_result);
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  return ScheduleRecord{ToRowId(row[0]), ToRowId(row[1]),        row[2] ? row[2] : "",
                        ToInt(row[3]),   ParseTimestamp(row[4]), ParseTimestamp(row[5])};
}

std::vector<ScheduledCourse> MariaDbSession::ListScheduleCourses(RowId schedule_id) {
  std::ostringstream oss;
  oss << "SELECT c.id, c.course_code, c.name, c.credits, c.instructor, c.time_slot, c.room, c.weeks, c.capacity, "
         "c.created_at, e.created_at FROM schedule_entries e INNER JOIN courses c ON c.id = e.course_id "
         "WHERE e.schedule_id="
      << schedule_id << " ORDER BY e.created_at ASC, c.id ASC;";
  ResultPtr res(Query(oss.str(), "시간표 과목 조회 실패"), mysql_free_result);
  std::vector<ScheduledCourse> courses;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    courses.push_back(ScheduledCourse{BuildCourse(row), ParseTimestamp(row[10])});
  }
  return courses;
}

std::vector<ScheduleSummary> MariaDbSession::ListSchedulesForUser(RowId user_id) {
  std::ostringstream oss;
  oss << "SELECT s.id, s.name, s.total_credits, COUNT(e.course_id), s.created_at FROM schedules s "
         "LEFT JOIN schedule_entries e ON e.schedule_id = s.id WHERE s.user_id="
      << user_id
      << " GROUP BY s.id, s.name, s.total_credits, s.created_at ORDER BY s.created_at DESC, s.id DESC;";
  ResultPtr res(Query(oss.str(), "사용자 시간표 조회 실패"), mysql_free_result);
  std::vector<ScheduleSummary> schedules;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    schedules.push_back(ScheduleSummary{ToRowId(row[0]), row[1] ? row[1] : "", ToInt(row[2]),
                                        row[3] ? static_cast<std::size_t>(std::stoull(row[3])) : 0,
                                        ParseTimestamp(row[4])});
  }
  return schedules;
}

void MariaDbSession::Exec(const std::string& sql, const std::string& ctx) {
  if (mysql_query(conn_, sql.c_str()) != 0) {
    RaiseError(ctx);
  }
}

MYSQL_RES* MariaDbSession::Query(const std::string& sql, const std::string& ctx) {
  Exec(sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn_);
  if (!res) {
    RaiseError(ctx + " (결과 없음)");
  }
  return res;
}

std::string MariaDbSession::Escape(const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn_, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

std::string MariaDbSession::Quote(const std::optional<std::string>& value) const {
  if (!value) {
    return "NULL";
  }
  return "'" + Escape(*value) + "'";
}

void MariaDbSession::RaiseError(const std::string& ctx) {
  unsigned int code = mysql_errno(conn_);
  std::string message = ctx + ": " + mysql_error(conn_);
  if (IsConnectionLoss(code)) {
    broken_ = true;
    pool_->MarkDisconnected();
  }
  ThrowStoreError(code, message);
}

}  // namespace planner
