#include <gtest/gtest.h>

#include "planner/api_response.hpp"
#include "planner/errors.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = planner::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = planner::MakeErrorEnvelope("validation_error", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "validation_error");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, CourseInputAcceptsAliases) {
  auto course = planner::ParseCourseInput(nlohmann::json{{"courseCode", "IT101"},
                                                         {"name", "자료구조"},
                                                         {"credits", 3},
                                                         {"instructor", "박교수"},
                                                         {"schedule", "월 1-3"},
                                                         {"capacity", "40"}});
  EXPECT_EQ(course.course_code, "IT101");
  EXPECT_EQ(course.name, "자료구조");
  EXPECT_EQ(course.credits, 3);
  EXPECT_EQ(course.instructor, std::optional<std::string>("박교수"));
  EXPECT_EQ(course.time, std::optional<std::string>("월 1-3"));
  EXPECT_EQ(course.capacity, std::optional<int>(40));
  EXPECT_FALSE(course.room.has_value());
}

TEST(JsonEnvelopeTest, PrimaryFieldNamesWinOverAliases) {
  auto course = planner::ParseCourseInput(
      nlohmann::json{{"courseCode", "IT101"}, {"courseName", "정식"}, {"name", "별칭"}, {"quantity", 30},
                     {"capacity", 10}});
  EXPECT_EQ(course.name, "정식");
  EXPECT_EQ(course.capacity, std::optional<int>(30));
}

TEST(JsonEnvelopeTest, MalformedCourseFieldsAreValidationErrors) {
  EXPECT_THROW(planner::ParseCourseInput(nlohmann::json{{"courseCode", "IT101"}, {"credits", "three"}}),
               planner::ValidationError);
  EXPECT_THROW(planner::ParseCourseInput(nlohmann::json::array()), planner::ValidationError);
}

TEST(JsonEnvelopeTest, OutOfRangeIntegersAreValidationErrors) {
  using planner::ParseCourseInput;
  EXPECT_THROW(ParseCourseInput(nlohmann::json::parse(R"({"courseCode":"IT1","credits":4294967299})")),
               planner::ValidationError);
  EXPECT_THROW(ParseCourseInput(nlohmann::json::parse(R"({"courseCode":"IT1","credits":-4294967299})")),
               planner::ValidationError);
  EXPECT_THROW(
      ParseCourseInput(nlohmann::json::parse(R"({"courseCode":"IT1","credits":3,"capacity":18446744073709551615})")),
      planner::ValidationError);
  EXPECT_THROW(ParseCourseInput(nlohmann::json{{"courseCode", "IT1"}, {"credits", "99999999999"}}),
               planner::ValidationError);
  auto edge = ParseCourseInput(nlohmann::json::parse(R"({"courseCode":"IT1","credits":2147483647})"));
  EXPECT_EQ(edge.credits, 2147483647);
}

TEST(JsonEnvelopeTest, ScheduleSummaryUsesCamelCaseKeys) {
  planner::ScheduleSummary summary{7, "시간표", 12, 4, std::chrono::system_clock::from_time_t(0)};
  auto j = planner::ToJson(summary);
  EXPECT_EQ(j["scheduleId"], 7);
  EXPECT_EQ(j["scheduleName"], "시간표");
  EXPECT_EQ(j["totalCredits"], 12);
  EXPECT_EQ(j["courseCount"], 4);
  EXPECT_EQ(j["createdAt"], "1970-01-01T00:00:00Z");
}
