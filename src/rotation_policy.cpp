/*
 * 설명: 토큰 회전 정책을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rotation_policy_test.cpp
 */
#include "dropguard/rotation_policy.hpp"

namespace dropguard {

bool ShouldRotate(std::int64_t threshold_seconds, TimePoint last_activity_at, TimePoint now) {
  if (threshold_seconds == kRotateAlways) {
    return true;
  }
  if (threshold_seconds <= kRotateNever) {
    return false;
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last_activity_at).count();
  return elapsed >= threshold_seconds;
}

}  // namespace dropguard
