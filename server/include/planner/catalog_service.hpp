/*
 * 설명: 과목 카탈로그 검색/단건 조회.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/catalog_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "planner/models.hpp"
#include "planner/retry_executor.hpp"

namespace planner {

class CatalogService {
 public:
  static constexpr std::size_t kMaxPageSize = 100;

  explicit CatalogService(std::shared_ptr<RetryExecutor> executor);

  CoursePage ListCourses(const std::string& query, std::size_t page, std::size_t size) const;
  CourseRecord GetCourse(RowId course_id) const;

 private:
  std::shared_ptr<RetryExecutor> executor_;
};

}  // namespace planner
