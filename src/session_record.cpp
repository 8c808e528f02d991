/*
 * 설명: 세션 레코드의 시간 변환과 JSON 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_record_test.cpp
 */
#include "dropguard/session_record.hpp"

namespace dropguard {
namespace {
nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> OptionalFromJson(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}
}  // namespace

Clock SystemClock() {
  return []() { return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()); };
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(std::int64_t seconds) { return TimePoint{std::chrono::seconds(seconds)}; }

nlohmann::json SessionRecordToJson(const SessionRecord& record) {
  nlohmann::json data;
  data["ip"] = OptionalToJson(record.fingerprint.origin_ip);
  data["userAgent"] = OptionalToJson(record.fingerprint.user_agent);
  data["userData"] = record.application_data;

  nlohmann::json body;
  body["ownerId"] = record.owner_id;
  body["data"] = data;
  body["createdAt"] = ToUnixSeconds(record.created_at);
  body["lastActivityAt"] = ToUnixSeconds(record.last_activity_at);
  return body;
}

SessionRecord SessionRecordFromJson(const std::string& session_id, const nlohmann::json& body) {
  SessionRecord record;
  record.session_id = session_id;
  record.owner_id = body.at("ownerId").get<std::string>();
  const auto& data = body.at("data");
  record.fingerprint.origin_ip = OptionalFromJson(data, "ip");
  record.fingerprint.user_agent = OptionalFromJson(data, "userAgent");
  record.application_data = data.value("userData", nlohmann::json::object());
  record.created_at = FromUnixSeconds(body.at("createdAt").get<std::int64_t>());
  record.last_activity_at = FromUnixSeconds(body.at("lastActivityAt").get<std::int64_t>());
  return record;
}

}  // namespace dropguard
