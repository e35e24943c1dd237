/*
 * 설명: 시간표 생성/수정/삭제/조회. 사용자·과목 해석과 헤더/엔트리 삽입을 한 트랜잭션으로 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/schedule_service_test.cpp, server/tests/it/mariadb_schedule_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "planner/models.hpp"
#include "planner/retry_executor.hpp"
#include "planner/store.hpp"
#include "planner/user_resolver.hpp"

namespace planner {

using ClockFn = std::function<std::chrono::system_clock::time_point()>;

class ScheduleService {
 public:
  ScheduleService(std::shared_ptr<RetryExecutor> executor, std::shared_ptr<UserResolver> resolver,
                  ClockFn clock = [] { return std::chrono::system_clock::now(); });

  CreateScheduleResult CreateSchedule(const std::string& user_identifier, const std::optional<std::string>& name,
                                      const std::vector<CourseInput>& courses, const UserHints& hints = {}) const;
  CreateScheduleResult UpdateSchedule(RowId schedule_id, const std::vector<CourseInput>& courses,
                                      const std::optional<std::string>& name = std::nullopt) const;
  void DeleteSchedule(RowId schedule_id) const;

  // 알 수 없는 사용자는 빈 목록을 돌려준다.
  std::vector<ScheduleSummary> GetUserSchedules(const std::string& user_identifier) const;
  ScheduleDetails GetScheduleDetails(RowId schedule_id) const;

  std::string DefaultScheduleName() const;

 private:
  struct ResolvedCourses {
    std::vector<RowId> ids;
    int total_credits{0};
  };

  // 정규화한 코드와 해석된 id 기준으로 중복을 제거한다. 합계가 int를 넘으면 ValidationError.
  ResolvedCourses ResolveCourses(StoreSession& session, const std::vector<CourseInput>& courses) const;
  RowId ResolveCourse(StoreSession& session, const CourseInput& course, int& credits) const;

  std::shared_ptr<RetryExecutor> executor_;
  std::shared_ptr<UserResolver> resolver_;
  ClockFn clock_;
};

void ValidateCourses(const std::vector<CourseInput>& courses);
// 앞뒤 공백 제거 후 ASCII 대문자화. 저장소의 대소문자 무시 비교와 같은 키를 만든다.
std::string NormalizeCourseCode(const std::string& code);

}  // namespace planner
