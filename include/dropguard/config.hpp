/*
 * 설명: 세션 프로토콜 옵션, 프리셋 빌더, 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dropguard {

constexpr std::int64_t kMinSessionExpirySeconds = 60;

struct CookieOptions {
  std::string path{"/"};
  std::string domain;
  bool secure{true};
  bool http_only{true};
  std::string same_site{"Strict"};
};

struct ProtocolConfig {
  std::chrono::seconds session_expiry{3600};
  bool allow_multiple_sessions{false};
  std::size_t max_sessions_per_owner{5};
  std::string cookie_name{"drop_session"};
  CookieOptions cookie_options;
  bool strict_ip{false};
  bool strict_ua{false};
  // 0: 회전 안 함, -1: 매 검증마다 회전, N: 비활성 N 초 이상이면 회전
  std::int64_t rotation_threshold_seconds{300};
  bool sliding_expiration{true};
};

class ProtocolConfigBuilder {
 public:
  ProtocolConfigBuilder() = default;

  static ProtocolConfigBuilder Balanced();
  static ProtocolConfigBuilder HighSecurity();
  static ProtocolConfigBuilder Development();

  ProtocolConfigBuilder& WithSessionExpiry(std::int64_t seconds);
  ProtocolConfigBuilder& EnableMultipleSessions();
  // 최대 세션 수도 1 로 고정한다.
  ProtocolConfigBuilder& DisableMultipleSessions();
  // 1 미만은 1 로 올린다.
  ProtocolConfigBuilder& WithMaxSessionsPerOwner(std::int64_t max);
  ProtocolConfigBuilder& WithCookieName(const std::string& name);
  ProtocolConfigBuilder& WithCookieOptions(const CookieOptions& options);
  ProtocolConfigBuilder& WithCookieSecure(bool secure);
  ProtocolConfigBuilder& WithCookieDomain(const std::string& domain);
  ProtocolConfigBuilder& EnableStrictIpValidation();
  ProtocolConfigBuilder& EnableStrictUaValidation();
  ProtocolConfigBuilder& DisableStrictIpValidation();
  ProtocolConfigBuilder& DisableStrictUaValidation();
  ProtocolConfigBuilder& DisableStrictValidation();
  ProtocolConfigBuilder& WithRotationThreshold(std::int64_t seconds);
  ProtocolConfigBuilder& EnableSlidingExpiration();
  ProtocolConfigBuilder& DisableSlidingExpiration();

  // 만료가 60초 미만이면 std::invalid_argument 를 던진다.
  ProtocolConfig Build() const;

 private:
  std::int64_t session_expiry_seconds_{3600};
  ProtocolConfig config_;
};

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string session_store;
  std::string log_level;
  std::string ops_token;
  std::size_t purge_interval_seconds;
  ProtocolConfig protocol;
};

AppConfig LoadConfigFromEnv();

}  // namespace dropguard
