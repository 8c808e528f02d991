/*
 * 설명: 요청 단위 컨텍스트(원격 IP, User-Agent, 쿠키 저장소)를 엔진에 명시적으로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_protocol_test.cpp
 */
#pragma once

#include <optional>
#include <string>

#include "dropguard/cookie_jar.hpp"
#include "dropguard/session_record.hpp"

namespace dropguard {

struct RequestContext {
  std::optional<std::string> remote_ip;
  std::optional<std::string> user_agent;
  CookieJar& cookies;

  SecurityFingerprint Fingerprint() const { return SecurityFingerprint{remote_ip, user_agent}; }
};

}  // namespace dropguard
