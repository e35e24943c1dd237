/*
 * 설명: 시간표 쓰기 경로. 재시도 시 전체 트랜잭션을 처음부터 다시 계산하므로 부분 성공을 가정하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/schedule_service_test.cpp, server/tests/it/mariadb_schedule_it_test.cpp
 */
#include "planner/schedule_service.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "planner/errors.hpp"

namespace planner {

std::string NormalizeCourseCode(const std::string& code) {
  auto begin = code.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = code.find_last_not_of(" \t\r\n");
  std::string normalized = code.substr(begin, end - begin + 1);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return normalized;
}

void ValidateCourses(const std::vector<CourseInput>& courses) {
  if (courses.empty()) {
    throw ValidationError("과목 목록이 비어 있습니다");
  }
  for (const auto& course : courses) {
    if (NormalizeCourseCode(course.course_code).empty()) {
      throw ValidationError("courseCode가 필요합니다");
    }
    if (course.credits < 0) {
      throw ValidationError("학점은 음수일 수 없습니다: " + course.course_code);
    }
    if (course.capacity && *course.capacity < 0) {
      throw ValidationError("정원은 음수일 수 없습니다: " + course.course_code);
    }
  }
}

ScheduleService::ScheduleService(std::shared_ptr<RetryExecutor> executor, std::shared_ptr<UserResolver> resolver,
                                 ClockFn clock)
    : executor_(std::move(executor)), resolver_(std::move(resolver)), clock_(std::move(clock)) {}

CreateScheduleResult ScheduleService::CreateSchedule(const std::string& user_identifier,
                                                     const std::optional<std::string>& name,
                                                     const std::vector<CourseInput>& courses,
                                                     const UserHints& hints) const {
  ValidateCourses(courses);
  if (!UserResolver::DeriveEmail(user_identifier, hints) && !UserResolver::ParseUserId(user_identifier)) {
    throw ValidationError("사용자 이메일을 확인할 수 없습니다");
  }
  std::string schedule_name = name && !name->empty() ? *name : DefaultScheduleName();

  CreateScheduleResult result{};
  executor_->ExecuteTransactionWithRetry("schedule.create", [&](StoreSession& session) {
    RowId user_id = resolver_->ResolveInSession(session, user_identifier, hints);
    auto resolved = ResolveCourses(session, courses);
    RowId schedule_id = session.InsertSchedule(user_id, schedule_name, resolved.total_credits);
    for (RowId course_id : resolved.ids) {
      session.InsertScheduleEntry(schedule_id, course_id);
    }
    result = CreateScheduleResult{schedule_id, schedule_name, resolved.total_credits, resolved.ids.size()};
    return true;
  });
  return result;
}

CreateScheduleResult ScheduleService::UpdateSchedule(RowId schedule_id, const std::vector<CourseInput>& courses,
                                                     const std::optional<std::string>& name) const {
  ValidateCourses(courses);
  std::optional<std::string> new_name;
  if (name && !name->empty()) {
    new_name = name;
  }

  CreateScheduleResult result{};
  executor_->ExecuteTransactionWithRetry("schedule.update", [&](StoreSession& session) {
    auto existing = session.FindSchedule(schedule_id);
    if (!existing) {
      throw NotFoundError("시간표를 찾을 수 없습니다: " + std::to_string(schedule_id));
    }
    auto resolved = ResolveCourses(session, courses);
    session.DeleteScheduleEntries(schedule_id);
    for (RowId course_id : resolved.ids) {
      session.InsertScheduleEntry(schedule_id, course_id);
    }
    if (!session.UpdateScheduleHeader(schedule_id, new_name, resolved.total_credits)) {
      throw NotFoundError("시간표를 찾을 수 없습니다: " + std::to_string(schedule_id));
    }
    result = CreateScheduleResult{schedule_id, new_name.value_or(existing->name), resolved.total_credits,
                                  resolved.ids.size()};
    return true;
  });
  return result;
}

void ScheduleService::DeleteSchedule(RowId schedule_id) const {
  executor_->ExecuteTransactionWithRetry("schedule.delete", [&](StoreSession& session) {
    if (!session.DeleteSchedule(schedule_id)) {
      throw NotFoundError("시간표를 찾을 수 없습니다: " + std::to_string(schedule_id));
    }
    return true;
  });
}

std::vector<ScheduleSummary> ScheduleService::GetUserSchedules(const std::string& user_identifier) const {
  return executor_->Execute<std::vector<ScheduleSummary>>("schedule.list", [&](StoreSession& session) {
    auto user_id = resolver_->FindUserId(session, user_identifier);
    if (!user_id) {
      return std::vector<ScheduleSummary>{};
    }
    return session.ListSchedulesForUser(*user_id);
  });
}

ScheduleDetails ScheduleService::GetScheduleDetails(RowId schedule_id) const {
  return executor_->Execute<ScheduleDetails>("schedule.details", [&](StoreSession& session) {
    auto schedule = session.FindSchedule(schedule_id);
    if (!schedule) {
      throw NotFoundError("시간표를 찾을 수 없습니다: " + std::to_string(schedule_id));
    }
    return ScheduleDetails{*schedule, session.ListScheduleCourses(schedule_id)};
  });
}

std::string ScheduleService::DefaultScheduleName() const {
  auto now = std::chrono::system_clock::to_time_t(clock_());
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream ss;
  ss << "시간표 " << std::put_time(&tm, "%Y-%m-%d %H:%M");
  return ss.str();
}

ScheduleService::ResolvedCourses ScheduleService::ResolveCourses(StoreSession& session,
                                                                 const std::vector<CourseInput>& courses) const {
  ResolvedCourses resolved;
  std::unordered_set<std::string> seen_codes;
  std::unordered_set<RowId> seen_ids;
  std::int64_t total = 0;
  for (const auto& input : courses) {
    CourseInput course = input;
    course.course_code = NormalizeCourseCode(input.course_code);
    if (!seen_codes.insert(course.course_code).second) {
      continue;
    }
    int credits = 0;
    RowId id = ResolveCourse(session, course, credits);
    // 정규화로 못 잡은 콜레이션 동치(악센트 등)는 id로 거른다.
    if (!seen_ids.insert(id).second) {
      continue;
    }
    resolved.ids.push_back(id);
    total += credits;
    if (total > std::numeric_limits<int>::max()) {
      throw ValidationError("총 학점이 허용 범위를 넘었습니다");
    }
  }
  resolved.total_credits = static_cast<int>(total);
  return resolved;
}

RowId ScheduleService::ResolveCourse(StoreSession& session, const CourseInput& course, int& credits) const {
  if (auto existing = session.FindCourseByCode(course.course_code)) {
    credits = existing->credits;
    return existing->id;
  }
  CourseInput insert = course;
  if (insert.name.empty()) {
    insert.name = insert.course_code;
  }
  try {
    RowId id = session.InsertCourse(insert);
    credits = insert.credits;
    return id;
  } catch (const ConstraintViolation&) {
    if (auto existing = session.FindCourseByCode(course.course_code)) {
      credits = existing->credits;
      return existing->id;
    }
    throw;
  }
}

}  // namespace planner
