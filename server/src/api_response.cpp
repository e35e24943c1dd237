/*
 * 설명: JSON 응답 엔벨로프를 생성하고 요청 본문을 레코드로 변환한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "planner/api_response.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

#include "planner/errors.hpp"

namespace planner {
namespace {
std::string CurrentTimestamp() { return FormatTimestamp(std::chrono::system_clock::now()); }

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

const nlohmann::json* FindField(const nlohmann::json& body, const char* primary, const char* alias) {
  auto it = body.find(primary);
  if (it != body.end() && !it->is_null()) {
    return &*it;
  }
  if (alias) {
    it = body.find(alias);
    if (it != body.end() && !it->is_null()) {
      return &*it;
    }
  }
  return nullptr;
}

std::optional<std::string> OptionalString(const nlohmann::json& body, const char* primary,
                                          const char* alias = nullptr) {
  const auto* field = FindField(body, primary, alias);
  if (!field) {
    return std::nullopt;
  }
  if (field->is_string()) {
    return field->get<std::string>();
  }
  if (field->is_number()) {
    return field->dump();
  }
  throw ValidationError(std::string(primary) + " 형식이 올바르지 않습니다");
}

std::optional<int> OptionalInt(const nlohmann::json& body, const char* primary, const char* alias = nullptr) {
  const auto* field = FindField(body, primary, alias);
  if (!field) {
    return std::nullopt;
  }
  if (field->is_number_unsigned()) {
    auto value = field->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw ValidationError(std::string(primary) + " 값이 허용 범위를 넘었습니다");
    }
    return static_cast<int>(value);
  }
  if (field->is_number_integer()) {
    auto value = field->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
      throw ValidationError(std::string(primary) + " 값이 허용 범위를 넘었습니다");
    }
    return static_cast<int>(value);
  }
  if (field->is_string()) {
    const auto text = field->get<std::string>();
    try {
      std::size_t pos = 0;
      int value = std::stoi(text, &pos);
      if (pos == text.size()) {
        return value;
      }
    } catch (const std::logic_error&) {
      throw ValidationError(std::string(primary) + "는 정수여야 합니다");
    }
  }
  throw ValidationError(std::string(primary) + "는 정수여야 합니다");
}
}  // namespace

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto itt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const CourseRecord& course) {
  nlohmann::json j;
  j["courseId"] = course.id;
  j["courseCode"] = course.course_code;
  j["courseName"] = course.name;
  j["credits"] = course.credits;
  j["lecturer"] = OptionalToJson(course.instructor);
  j["time"] = OptionalToJson(course.time);
  j["room"] = OptionalToJson(course.room);
  j["weeks"] = OptionalToJson(course.weeks);
  j["quantity"] = course.capacity ? nlohmann::json(*course.capacity) : nlohmann::json(nullptr);
  j["createdAt"] = FormatTimestamp(course.created_at);
  return j;
}

nlohmann::json ToJson(const ScheduleSummary& summary) {
  return {{"scheduleId", summary.schedule_id},
          {"scheduleName", summary.name},
          {"totalCredits", summary.total_credits},
          {"courseCount", summary.course_count},
          {"createdAt", FormatTimestamp(summary.created_at)}};
}

nlohmann::json ToJson(const ScheduleDetails& details) {
  nlohmann::json courses = nlohmann::json::array();
  for (const auto& entry : details.courses) {
    auto course = ToJson(entry.course);
    course["addedAt"] = FormatTimestamp(entry.added_at);
    courses.push_back(std::move(course));
  }
  nlohmann::json schedule{{"scheduleId", details.schedule.id},
                          {"userId", details.schedule.user_id},
                          {"scheduleName", details.schedule.name},
                          {"totalCredits", details.schedule.total_credits},
                          {"createdAt", FormatTimestamp(details.schedule.created_at)},
                          {"updatedAt", FormatTimestamp(details.schedule.updated_at)}};
  return {{"schedule", schedule}, {"courses", courses}};
}

nlohmann::json ToJson(const CreateScheduleResult& result) {
  return {{"scheduleId", result.schedule_id},
          {"scheduleName", result.name},
          {"totalCredits", result.total_credits},
          {"courseCount", result.course_count}};
}

CourseInput ParseCourseInput(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw ValidationError("과목 항목은 객체여야 합니다");
  }
  CourseInput course;
  course.course_code = OptionalString(body, "courseCode").value_or("");
  course.name = OptionalString(body, "courseName", "name").value_or("");
  course.credits = OptionalInt(body, "credits").value_or(0);
  course.instructor = OptionalString(body, "lecturer", "instructor");
  course.time = OptionalString(body, "time", "schedule");
  course.room = OptionalString(body, "room");
  course.weeks = OptionalString(body, "weeks");
  course.capacity = OptionalInt(body, "quantity", "capacity");
  return course;
}

UserHints ParseUserHints(const nlohmann::json& body) {
  UserHints hints;
  if (!body.is_object()) {
    return hints;
  }
  hints.email = OptionalString(body, "email");
  hints.name = OptionalString(body, "name");
  hints.student_id = OptionalString(body, "studentId");
  if (auto role = OptionalString(body, "role")) {
    hints.role = ParseRole(*role);
    if (!hints.role) {
      throw ValidationError("role은 student 또는 staff여야 합니다");
    }
  }
  return hints;
}

}  // namespace planner
