/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace dropguard {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail 이 null 이 아니면 error.detail 에 그대로 싣는다.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

}  // namespace dropguard
