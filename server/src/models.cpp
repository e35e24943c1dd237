/*
 * 설명: 사용자 역할 문자열 변환.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "planner/models.hpp"

#include <algorithm>
#include <cctype>

namespace planner {

const char* ToString(UserRole role) {
  switch (role) {
    case UserRole::kStaff:
      return "staff";
    case UserRole::kStudent:
    default:
      return "student";
  }
}

std::optional<UserRole> ParseRole(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "student") {
    return UserRole::kStudent;
  }
  if (lowered == "staff") {
    return UserRole::kStaff;
  }
  return std::nullopt;
}

}  // namespace planner
