/*
 * 설명: JSON 응답 엔벨로프를 생성한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/json_envelope_test.cpp
 */
#include "dropguard/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dropguard {
namespace {
std::string CurrentTimestamp() {
  auto itt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm = *std::gmtime(&itt);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

}  // namespace dropguard
