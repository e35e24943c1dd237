/*
 * 설명: 과목 카탈로그 조회. 모든 읽기는 RetryExecutor를 거친다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/catalog_service_test.cpp
 */
#include "planner/catalog_service.hpp"

#include <utility>

#include "planner/errors.hpp"

namespace planner {

CatalogService::CatalogService(std::shared_ptr<RetryExecutor> executor) : executor_(std::move(executor)) {}

CoursePage CatalogService::ListCourses(const std::string& query, std::size_t page, std::size_t size) const {
  if (page < 1) {
    throw ValidationError("page는 1 이상이어야 합니다");
  }
  if (size < 1 || size > kMaxPageSize) {
    throw ValidationError("size는 1~100 사이여야 합니다");
  }
  CourseFilter filter{query, page, size};
  return executor_->Execute<CoursePage>("course.list",
                                        [&](StoreSession& session) { return session.ListCourses(filter); });
}

CourseRecord CatalogService::GetCourse(RowId course_id) const {
  return executor_->Execute<CourseRecord>("course.get", [&](StoreSession& session) {
    auto course = session.FindCourseById(course_id);
    if (!course) {
      throw NotFoundError("과목을 찾을 수 없습니다: " + std::to_string(course_id));
    }
    return *course;
  });
}

}  // namespace planner
