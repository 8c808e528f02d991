/*
 * 설명: 프로토콜 옵션 빌더와 환경변수 기반 설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_test.cpp
 */
#include "dropguard/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace dropguard {
namespace {
std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string& value, bool fallback) {
  auto lowered = ToLower(value);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return fallback;
}

ProtocolConfigBuilder BuilderForPreset(const std::string& preset) {
  auto lowered = ToLower(preset);
  if (lowered.empty() || lowered == "default") {
    return ProtocolConfigBuilder();
  }
  if (lowered == "balanced") {
    return ProtocolConfigBuilder::Balanced();
  }
  if (lowered == "high_security") {
    return ProtocolConfigBuilder::HighSecurity();
  }
  if (lowered == "development") {
    return ProtocolConfigBuilder::Development();
  }
  throw std::invalid_argument("알 수 없는 프리셋: " + preset);
}
}  // namespace

ProtocolConfigBuilder ProtocolConfigBuilder::Balanced() {
  ProtocolConfigBuilder builder;
  builder.WithSessionExpiry(3600)
      .WithRotationThreshold(300)
      .EnableSlidingExpiration()
      .DisableStrictValidation()
      .EnableMultipleSessions()
      .WithMaxSessionsPerOwner(5);
  return builder;
}

ProtocolConfigBuilder ProtocolConfigBuilder::HighSecurity() {
  ProtocolConfigBuilder builder;
  builder.WithSessionExpiry(1800)
      .WithRotationThreshold(60)
      .EnableStrictIpValidation()
      .EnableStrictUaValidation()
      .DisableMultipleSessions()
      .WithMaxSessionsPerOwner(1);
  return builder;
}

ProtocolConfigBuilder ProtocolConfigBuilder::Development() {
  ProtocolConfigBuilder builder;
  builder.WithSessionExpiry(86400)
      .WithRotationThreshold(0)
      .WithCookieSecure(false)
      .DisableStrictValidation()
      .EnableMultipleSessions()
      .WithMaxSessionsPerOwner(10);
  return builder;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithSessionExpiry(std::int64_t seconds) {
  session_expiry_seconds_ = seconds;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::EnableMultipleSessions() {
  config_.allow_multiple_sessions = true;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::DisableMultipleSessions() {
  config_.allow_multiple_sessions = false;
  config_.max_sessions_per_owner = 1;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithMaxSessionsPerOwner(std::int64_t max) {
  config_.max_sessions_per_owner = static_cast<std::size_t>(std::max<std::int64_t>(1, max));
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithCookieName(const std::string& name) {
  config_.cookie_name = name;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithCookieOptions(const CookieOptions& options) {
  config_.cookie_options = options;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithCookieSecure(bool secure) {
  config_.cookie_options.secure = secure;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithCookieDomain(const std::string& domain) {
  config_.cookie_options.domain = domain;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::EnableStrictIpValidation() {
  config_.strict_ip = true;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::EnableStrictUaValidation() {
  config_.strict_ua = true;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::DisableStrictIpValidation() {
  config_.strict_ip = false;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::DisableStrictUaValidation() {
  config_.strict_ua = false;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::DisableStrictValidation() {
  config_.strict_ip = false;
  config_.strict_ua = false;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::WithRotationThreshold(std::int64_t seconds) {
  config_.rotation_threshold_seconds = seconds;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::EnableSlidingExpiration() {
  config_.sliding_expiration = true;
  return *this;
}

ProtocolConfigBuilder& ProtocolConfigBuilder::DisableSlidingExpiration() {
  config_.sliding_expiration = false;
  return *this;
}

ProtocolConfig ProtocolConfigBuilder::Build() const {
  if (session_expiry_seconds_ < kMinSessionExpirySeconds) {
    throw std::invalid_argument("세션 만료는 최소 60초 이상이어야 합니다");
  }
  ProtocolConfig config = config_;
  config.session_expiry = std::chrono::seconds(session_expiry_seconds_);
  return config;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto has_env = [](const char* key) { return std::getenv(key) != nullptr; };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.session_store = ToLower(get_env("SESSION_STORE", "memory"));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.purge_interval_seconds = static_cast<std::size_t>(std::stoul(get_env("PURGE_INTERVAL_SECONDS", "60")));

  auto builder = BuilderForPreset(get_env("DROP_PRESET", ""));
  if (has_env("DROP_SESSION_EXPIRY")) {
    builder.WithSessionExpiry(std::stoll(get_env("DROP_SESSION_EXPIRY", "3600")));
  }
  if (has_env("DROP_ALLOW_MULTIPLE")) {
    if (ParseBool(get_env("DROP_ALLOW_MULTIPLE", "false"), false)) {
      builder.EnableMultipleSessions();
    } else {
      builder.DisableMultipleSessions();
    }
  }
  if (has_env("DROP_MAX_SESSIONS")) {
    builder.WithMaxSessionsPerOwner(std::stoll(get_env("DROP_MAX_SESSIONS", "5")));
  }
  if (has_env("DROP_COOKIE_NAME")) {
    builder.WithCookieName(get_env("DROP_COOKIE_NAME", "drop_session"));
  }
  if (has_env("DROP_COOKIE_SECURE")) {
    builder.WithCookieSecure(ParseBool(get_env("DROP_COOKIE_SECURE", "true"), true));
  }
  if (has_env("DROP_COOKIE_DOMAIN")) {
    builder.WithCookieDomain(get_env("DROP_COOKIE_DOMAIN", ""));
  }
  if (has_env("DROP_STRICT_IP")) {
    if (ParseBool(get_env("DROP_STRICT_IP", "false"), false)) {
      builder.EnableStrictIpValidation();
    } else {
      builder.DisableStrictIpValidation();
    }
  }
  if (has_env("DROP_STRICT_UA")) {
    if (ParseBool(get_env("DROP_STRICT_UA", "false"), false)) {
      builder.EnableStrictUaValidation();
    } else {
      builder.DisableStrictUaValidation();
    }
  }
  if (has_env("DROP_ROTATION_THRESHOLD")) {
    builder.WithRotationThreshold(std::stoll(get_env("DROP_ROTATION_THRESHOLD", "300")));
  }
  if (has_env("DROP_SLIDING_EXPIRATION")) {
    if (ParseBool(get_env("DROP_SLIDING_EXPIRATION", "true"), true)) {
      builder.EnableSlidingExpiration();
    } else {
      builder.DisableSlidingExpiration();
    }
  }
  cfg.protocol = builder.Build();
  return cfg;
}

}  // namespace dropguard
