/*
 * 설명: 비활성 경과 시간과 임계값으로 세션 토큰 회전 여부를 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rotation_policy_test.cpp
 */
#pragma once

#include <cstdint>

#include "dropguard/session_record.hpp"

namespace dropguard {

constexpr std::int64_t kRotateNever = 0;
constexpr std::int64_t kRotateAlways = -1;

// 0 이면 회전하지 않고, -1 이면 항상 회전하며, N > 0 이면 경과 시간이 N 초 이상일 때 회전한다.
// 그 밖의 음수는 0 과 같다.
bool ShouldRotate(std::int64_t threshold_seconds, TimePoint last_activity_at, TimePoint now);

}  // namespace dropguard
