/*
 * 설명: 세션 레코드 데이터 모델과 원격 저장소용 JSON 직렬화 형식을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_record_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace dropguard {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

// 초 단위로 절삭한 system_clock 현재 시각을 돌려준다.
Clock SystemClock();

std::int64_t ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(std::int64_t seconds);

struct SecurityFingerprint {
  std::optional<std::string> origin_ip;
  std::optional<std::string> user_agent;
};

struct SessionRecord {
  std::string session_id;
  std::string owner_id;
  SecurityFingerprint fingerprint;
  TimePoint created_at{};
  TimePoint last_activity_at{};
  nlohmann::json application_data = nlohmann::json::object();
};

// {"ownerId", "data": {"ip", "userAgent", "userData"}, "createdAt", "lastActivityAt"}
// session_id 는 저장소 키이므로 본문에 포함하지 않는다.
nlohmann::json SessionRecordToJson(const SessionRecord& record);

// 형식이 맞지 않으면 nlohmann::json::exception 을 던진다.
SessionRecord SessionRecordFromJson(const std::string& session_id, const nlohmann::json& body);

}  // namespace dropguard
