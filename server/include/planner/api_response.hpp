/*
 * 설명: REST 응답 엔벨로프와 레코드 JSON 변환을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "planner/models.hpp"

namespace planner {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json ToJson(const CourseRecord& course);
nlohmann::json ToJson(const ScheduleSummary& summary);
nlohmann::json ToJson(const ScheduleDetails& details);
nlohmann::json ToJson(const CreateScheduleResult& result);

// courseName|name, lecturer|instructor, time|schedule, quantity|capacity 별칭을 받는다.
// 형식이 맞지 않으면 ValidationError.
CourseInput ParseCourseInput(const nlohmann::json& body);
UserHints ParseUserHints(const nlohmann::json& body);

}  // namespace planner
