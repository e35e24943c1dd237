/*
 * 설명: 사용자/과목/시간표 레코드와 호출자 입력 구조체.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace planner {

using RowId = std::int64_t;

enum class UserRole { kStudent, kStaff };

const char* ToString(UserRole role);
std::optional<UserRole> ParseRole(const std::string& text);

struct UserRecord {
  RowId id;
  std::string email;
  std::string name;
  std::optional<std::string> student_id;
  UserRole role;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct UserHints {
  std::optional<std::string> email;
  std::optional<std::string> name;
  std::optional<std::string> student_id;
  std::optional<UserRole> role;
};

struct NewUser {
  std::string email;
  std::string name;
  std::optional<std::string> student_id;
  UserRole role{UserRole::kStudent};
  std::optional<std::string> password_hash;
};

struct UserCredentials {
  RowId id;
  std::string email;
  std::string name;
  std::optional<std::string> student_id;
  UserRole role;
  std::string password_hash;
};

// 시간표 저장 요청에 실려 오는 과목 정보. course_code가 자연키다.
struct CourseInput {
  std::string course_code;
  std::string name;
  int credits{0};
  std::optional<std::string> instructor;
  std::optional<std::string> time;
  std::optional<std::string> room;
  std::optional<std::string> weeks;
  std::optional<int> capacity;
};

struct CourseRecord {
  RowId id;
  std::string course_code;
  std::string name;
  int credits;
  std::optional<std::string> instructor;
  std::optional<std::string> time;
  std::optional<std::string> room;
  std::optional<std::string> weeks;
  std::optional<int> capacity;
  std::chrono::system_clock::time_point created_at;
};

struct CourseFilter {
  std::string query;
  std::size_t page{1};
  std::size_t size{20};
};

struct CoursePage {
  std::size_t total;
  std::vector<CourseRecord> entries;
};

struct ScheduleRecord {
  RowId id;
  RowId user_id;
  std::string name;
  int total_credits;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct ScheduleSummary {
  RowId schedule_id;
  std::string name;
  int total_credits;
  std::size_t course_count;
  std::chrono::system_clock::time_point created_at;
};

struct ScheduledCourse {
  CourseRecord course;
  std::chrono::system_clock::time_point added_at;
};

struct ScheduleDetails {
  ScheduleRecord schedule;
  std::vector<ScheduledCourse> courses;
};

struct CreateScheduleResult {
  RowId schedule_id;
  std::string name;
  int total_credits;
  std::size_t course_count;
};

}  // namespace planner
