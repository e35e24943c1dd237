#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "planner/errors.hpp"
#include "service_harness.hpp"

namespace {

using planner_test::Course;
using planner_test::Permanent;
using planner_test::ServiceHarness;
using planner_test::Transient;

TEST(ScheduleServiceTest, CreateSumsCreditsAndInsertsOneEntryPerCourse) {
  ServiceHarness h;
  auto result = h.schedules->CreateSchedule("student@example.com", std::string("1학기"),
                                            {Course("IT101", 3), Course("IT102", 4)});

  EXPECT_EQ(result.total_credits, 7);
  EXPECT_EQ(result.course_count, 2u);
  EXPECT_EQ(result.name, "1학기");
  EXPECT_EQ(h.db->EntryCountFor(result.schedule_id), 2u);
  EXPECT_EQ(h.db->UserCount(), 1u);
  EXPECT_EQ(h.db->CommitCount(), 1u);
}

TEST(ScheduleServiceTest, EmptyCourseListIsRejectedWithoutTouchingStore) {
  ServiceHarness h;
  EXPECT_THROW(h.schedules->CreateSchedule("student@example.com", std::nullopt, {}), planner::ValidationError);
  EXPECT_EQ(h.db->OpenCount(), 0u);
  EXPECT_EQ(h.db->UserCount(), 0u);
}

TEST(ScheduleServiceTest, InvalidCourseFieldsAreRejected) {
  ServiceHarness h;
  EXPECT_THROW(h.schedules->CreateSchedule("student@example.com", std::nullopt, {Course("", 3)}),
               planner::ValidationError);
  EXPECT_THROW(h.schedules->CreateSchedule("student@example.com", std::nullopt, {Course("IT101", -1)}),
               planner::ValidationError);
  EXPECT_THROW(h.schedules->CreateSchedule("no-email-id", std::nullopt, {Course("IT101", 3)}),
               planner::ValidationError);
}

TEST(ScheduleServiceTest, KnownCourseCodeIsReusedAcrossSchedules) {
  ServiceHarness h;
  h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("NEW900", 2, "신규 과목")});
  h.schedules->CreateSchedule("b@example.com", std::nullopt, {Course("NEW900", 2, "신규 과목")});

  EXPECT_EQ(h.db->CourseCountWithCode("NEW900"), 1u);
  EXPECT_EQ(h.db->ScheduleCount(), 2u);
}

TEST(ScheduleServiceTest, TotalCreditsUseStoredCourseRow) {
  ServiceHarness h;
  h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 3)});
  // 이미 있는 과목이면 요청에 실린 학점을 믿지 않는다.
  auto result = h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 9)});
  EXPECT_EQ(result.total_credits, 3);
}

TEST(ScheduleServiceTest, DuplicateCodesInOneRequestAreCountedOnce) {
  ServiceHarness h;
  auto result = h.schedules->CreateSchedule("a@example.com", std::nullopt,
                                            {Course("IT101", 3), Course("IT101", 3), Course("IT102", 4)});
  EXPECT_EQ(result.course_count, 2u);
  EXPECT_EQ(result.total_credits, 7);
  EXPECT_EQ(h.db->EntryCountFor(result.schedule_id), 2u);
}

TEST(ScheduleServiceTest, CodesDifferingOnlyInCaseOrSpacesShareOneCourse) {
  ServiceHarness h;
  auto result = h.schedules->CreateSchedule("a@example.com", std::nullopt,
                                            {Course("IT101", 3), Course("it101", 3), Course(" IT101 ", 3)});
  EXPECT_EQ(result.course_count, 1u);
  EXPECT_EQ(result.total_credits, 3);
  EXPECT_EQ(h.db->EntryCountFor(result.schedule_id), 1u);
  EXPECT_EQ(h.db->CourseCount(), 1u);

  // 이후 요청도 소문자 코드로 같은 행을 찾는다.
  h.schedules->CreateSchedule("b@example.com", std::nullopt, {Course("it101", 3)});
  EXPECT_EQ(h.db->CourseCount(), 1u);
  EXPECT_EQ(planner::NormalizeCourseCode("  it101\t"), "IT101");
}

TEST(ScheduleServiceTest, TotalCreditsBeyondIntRangeAreRejected) {
  ServiceHarness h;
  const int big = std::numeric_limits<int>::max();
  EXPECT_THROW(
      h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("BIG1", big), Course("BIG2", big)}),
      planner::ValidationError);
  EXPECT_EQ(h.db->ScheduleCount(), 0u);
  EXPECT_EQ(h.db->CourseCount(), 0u);

  auto single = h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("BIG1", big)});
  EXPECT_EQ(single.total_credits, big);
}

TEST(ScheduleServiceTest, NumericUserIdentifierIsTrimmed) {
  ServiceHarness h;
  auto user_id = h.resolver->ResolveUser("a@example.com");
  auto padded = " " + std::to_string(user_id) + " ";
  auto result = h.schedules->CreateSchedule(padded, std::nullopt, {Course("IT101", 3)});
  EXPECT_EQ(h.db->UserCount(), 1u);
  EXPECT_EQ(h.schedules->GetUserSchedules(padded).size(), 1u);
  EXPECT_EQ(h.schedules->GetScheduleDetails(result.schedule_id).schedule.user_id, user_id);
}

TEST(ScheduleServiceTest, MissingNameGetsGeneratedLabel) {
  ServiceHarness h;
  auto result = h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 3)});
  EXPECT_EQ(result.name, "시간표 2026-01-01 00:00");
}

TEST(ScheduleServiceTest, CourseNameDefaultsToCode) {
  ServiceHarness h;
  auto result = h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 3)});
  auto details = h.schedules->GetScheduleDetails(result.schedule_id);
  ASSERT_EQ(details.courses.size(), 1u);
  EXPECT_EQ(details.courses[0].course.name, "IT101");
}

TEST(ScheduleServiceTest, UpdateReplacesEntriesAndRecomputesCredits) {
  ServiceHarness h;
  auto created = h.schedules->CreateSchedule("a@example.com", std::string("원본"),
                                             {Course("IT101", 3), Course("IT102", 4)});
  auto updated = h.schedules->UpdateSchedule(created.schedule_id, {Course("IT103", 2)});

  EXPECT_EQ(updated.total_credits, 2);
  EXPECT_EQ(updated.course_count, 1u);
  EXPECT_EQ(updated.name, "원본");
  EXPECT_EQ(h.db->EntryCountFor(created.schedule_id), 1u);

  auto details = h.schedules->GetScheduleDetails(created.schedule_id);
  EXPECT_EQ(details.schedule.total_credits, 2);
  ASSERT_EQ(details.courses.size(), 1u);
  EXPECT_EQ(details.courses[0].course.course_code, "IT103");
}

TEST(ScheduleServiceTest, UpdateRenamesOnlyWhenNameSupplied) {
  ServiceHarness h;
  auto created = h.schedules->CreateSchedule("a@example.com", std::string("원본"), {Course("IT101", 3)});
  auto renamed = h.schedules->UpdateSchedule(created.schedule_id, {Course("IT101", 3)}, std::string("수정본"));
  EXPECT_EQ(renamed.name, "수정본");
  EXPECT_EQ(h.schedules->GetScheduleDetails(created.schedule_id).schedule.name, "수정본");
}

TEST(ScheduleServiceTest, UpdateOfUnknownScheduleIsNotFound) {
  ServiceHarness h;
  EXPECT_THROW(h.schedules->UpdateSchedule(404, {Course("IT101", 3)}), planner::NotFoundError);
  EXPECT_EQ(h.db->CourseCount(), 0u);
}

TEST(ScheduleServiceTest, UpdateWithEmptyListIsRejected) {
  ServiceHarness h;
  auto created = h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 3)});
  EXPECT_THROW(h.schedules->UpdateSchedule(created.schedule_id, {}), planner::ValidationError);
  EXPECT_EQ(h.db->EntryCountFor(created.schedule_id), 1u);
}

TEST(ScheduleServiceTest, DeleteCascadesEntriesAndDetailsBecomeNotFound) {
  ServiceHarness h;
  auto created = h.schedules->CreateSchedule("a@example.com", std::nullopt,
                                             {Course("IT101", 3), Course("IT102", 4)});
  h.schedules->DeleteSchedule(created.schedule_id);

  EXPECT_THROW(h.schedules->GetScheduleDetails(created.schedule_id), planner::NotFoundError);
  EXPECT_EQ(h.db->EntryCount(), 0u);
  EXPECT_EQ(h.db->CourseCount(), 2u);
  EXPECT_THROW(h.schedules->DeleteSchedule(created.schedule_id), planner::NotFoundError);
}

TEST(ScheduleServiceTest, FailureAfterHeaderInsertLeavesNoPartialSchedule) {
  ServiceHarness h;
  h.db->FailOn("insert_schedule_entry", Permanent("Out of range value for column", 1264), 1);

  EXPECT_THROW(h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 3), Course("IT102", 4)}),
               planner::PersistenceError);

  EXPECT_EQ(h.db->CallCount("insert_schedule"), 1u);
  EXPECT_EQ(h.db->ScheduleCount(), 0u);
  EXPECT_EQ(h.db->EntryCount(), 0u);
  EXPECT_EQ(h.db->CourseCount(), 0u);
  EXPECT_EQ(h.db->UserCount(), 0u);
  EXPECT_EQ(h.db->RollbackCount(), 1u);
  EXPECT_TRUE(h.schedules->GetUserSchedules("a@example.com").empty());
}

TEST(ScheduleServiceTest, TransientFailureMidTransactionRetriesFromScratch) {
  ServiceHarness h;
  h.db->FailOn("insert_schedule_entry", Transient("Lost connection to server during query", 2013), 1);

  auto result = h.schedules->CreateSchedule("a@example.com", std::nullopt, {Course("IT101", 3), Course("IT102", 4)});

  EXPECT_EQ(result.total_credits, 7);
  EXPECT_EQ(h.db->ScheduleCount(), 1u);
  EXPECT_EQ(h.db->EntryCountFor(result.schedule_id), 2u);
  EXPECT_EQ(h.db->CourseCount(), 2u);
  EXPECT_EQ(h.db->UserCount(), 1u);
  EXPECT_EQ(h.db->OpenCount(), 2u);
}

TEST(ScheduleServiceTest, UserSchedulesListNewestFirstWithCounts) {
  ServiceHarness h;
  auto first = h.schedules->CreateSchedule("a@example.com", std::string("첫번째"), {Course("IT101", 3)});
  auto second = h.schedules->CreateSchedule("a@example.com", std::string("두번째"),
                                            {Course("IT101", 3), Course("IT102", 4)});
  h.schedules->CreateSchedule("other@example.com", std::nullopt, {Course("IT101", 3)});

  auto list = h.schedules->GetUserSchedules("a@example.com");
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].schedule_id, second.schedule_id);
  EXPECT_EQ(list[0].course_count, 2u);
  EXPECT_EQ(list[0].total_credits, 7);
  EXPECT_EQ(list[1].schedule_id, first.schedule_id);
}

TEST(ScheduleServiceTest, UnknownUserHasNoSchedules) {
  ServiceHarness h;
  EXPECT_TRUE(h.schedules->GetUserSchedules("ghost@example.com").empty());
  EXPECT_TRUE(h.schedules->GetUserSchedules("12345").empty());
  EXPECT_EQ(h.db->UserCount(), 0u);
}

}  // namespace
