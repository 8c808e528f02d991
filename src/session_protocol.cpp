/*
 * 설명: 세션 프로토콜 엔진을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_protocol_test.cpp, tests/e2e/session_http_flow_test.cpp
 */
#include "dropguard/session_protocol.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "dropguard/rotation_policy.hpp"
#include "dropguard/security_validator.hpp"
#include "dropguard/token_generator.hpp"

namespace dropguard {
namespace {
constexpr std::chrono::hours kCookieClearBackdate{1};

std::string JoinWarnings(const std::vector<std::string>& warnings) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < warnings.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << warnings[i];
  }
  return oss.str();
}
}  // namespace

SessionProtocol::SessionProtocol(std::shared_ptr<SessionStore> store, ProtocolConfig config,
                                 std::shared_ptr<Observability> observability, Clock clock)
    : store_(std::move(store)), config_(std::move(config)), observability_(std::move(observability)),
      clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("세션 저장소가 필요합니다");
  }
}

LoginResult SessionProtocol::Login(RequestContext& ctx, const std::string& owner_id,
                                   const nlohmann::json& application_data) {
  if (owner_id.empty()) {
    throw std::invalid_argument("owner_id 가 비어 있습니다");
  }

  if (!config_.allow_multiple_sessions) {
    store_->DeleteAllForOwner(owner_id);
  } else {
    auto active = store_->CountForOwner(owner_id);
    if (active >= config_.max_sessions_per_owner) {
      std::ostringstream oss;
      oss << "Maximum sessions limit reached (" << active << "/" << config_.max_sessions_per_owner
          << "). Logout from another device first.";
      LogEvent(LogLevel::kWarn, "session.login_rejected", owner_id, oss.str());
      throw SessionLimitError(oss.str(), active, config_.max_sessions_per_owner);
    }
  }

  auto now = clock_();
  SessionRecord record;
  record.owner_id = owner_id;
  record.fingerprint = ctx.Fingerprint();
  record.created_at = now;
  record.last_activity_at = now;
  record.application_data = application_data.is_null() ? nlohmann::json::object() : application_data;

  auto session_id = GenerateToken();
  record.session_id = session_id;
  store_->Create(session_id, owner_id, record, config_.session_expiry);
  SetSessionCookie(ctx, session_id);

  if (observability_) {
    observability_->IncrementLogin();
  }
  LogEvent(LogLevel::kInfo, "session.login", owner_id);
  return LoginResult{session_id, config_.session_expiry};
}

SessionRecord SessionProtocol::Validate(RequestContext& ctx) {
  auto session_id = SessionIdFromCookie(ctx);
  if (!session_id) {
    ClearSessionCookie(ctx);
    throw InvalidSessionError("No session cookie found", InvalidSessionReason::kNoCookie);
  }

  auto record = store_->Read(*session_id);
  if (!record) {
    ClearSessionCookie(ctx);
    throw InvalidSessionError("Session not found or expired", InvalidSessionReason::kNotFound);
  }

  auto verdict = ValidateSecurityContext(record->fingerprint, ctx.Fingerprint(), config_.strict_ip,
                                         config_.strict_ua);
  if (!verdict.valid) {
    store_->Delete(*session_id);
    ClearSessionCookie(ctx);
    auto joined = JoinWarnings(verdict.warnings);
    if (observability_) {
      observability_->IncrementSecurityViolation();
    }
    LogEvent(LogLevel::kWarn, "session.security_violation", record->owner_id, joined);
    throw SecurityViolationError("Security violation: " + joined, verdict.warnings);
  }
  for (const auto& warning : verdict.warnings) {
    if (observability_) {
      observability_->IncrementSecurityAdvisory();
    }
    LogEvent(LogLevel::kWarn, "session.security_advisory", record->owner_id, warning);
  }

  auto now = clock_();
  // 회전 판단은 이번 요청이 갱신하기 전의 마지막 활동 시각을 기준으로 한다.
  bool rotate = ShouldRotate(config_.rotation_threshold_seconds, record->last_activity_at, now);

  if (config_.sliding_expiration) {
    store_->RefreshTtl(*session_id, config_.session_expiry);
    record->last_activity_at = std::max(record->last_activity_at, now);
  }

  if (!rotate) {
    return *record;
  }

  auto new_id = GenerateToken();
  if (store_->RotateAtomic(*session_id, new_id, record->owner_id, *record, config_.session_expiry)) {
    SetSessionCookie(ctx, new_id);
    record->session_id = new_id;
    record->last_activity_at = std::max(record->last_activity_at, now);
    if (observability_) {
      observability_->IncrementRotation();
    }
    LogEvent(LogLevel::kDebug, "session.rotated", record->owner_id);
    return *record;
  }

  // 경쟁에서 졌거나 읽기와 회전 사이에 레코드가 사라졌다. 한 번만 다시 읽는다.
  if (observability_) {
    observability_->IncrementRotationConflict();
  }
  LogEvent(LogLevel::kWarn, "session.rotation_conflict", record->owner_id, "rotation failed, revalidating");
  auto current = store_->Read(*session_id);
  if (!current) {
    ClearSessionCookie(ctx);
    throw InvalidSessionError("Session was rotated concurrently, please retry",
                              InvalidSessionReason::kConcurrentRotation);
  }
  return *current;
}

void SessionProtocol::Logout(RequestContext& ctx) {
  auto session_id = SessionIdFromCookie(ctx);
  if (session_id) {
    store_->Delete(*session_id);
    LogEvent(LogLevel::kInfo, "session.logout", std::nullopt);
  }
  ClearSessionCookie(ctx);
}

void SessionProtocol::LogoutAll(RequestContext& ctx) {
  auto session_id = SessionIdFromCookie(ctx);
  if (session_id) {
    auto record = store_->Read(*session_id);
    if (record) {
      store_->DeleteAllForOwner(record->owner_id);
      LogEvent(LogLevel::kInfo, "session.logout_all", record->owner_id);
    }
  }
  ClearSessionCookie(ctx);
}

bool SessionProtocol::UpdateApplicationData(RequestContext& ctx, const nlohmann::json& data) {
  auto session_id = SessionIdFromCookie(ctx);
  if (!session_id) {
    ClearSessionCookie(ctx);
    throw InvalidSessionError("No session cookie found", InvalidSessionReason::kNoCookie);
  }
  return store_->UpdateApplicationData(*session_id, data);
}

std::optional<std::string> SessionProtocol::GetOwnerId(RequestContext& ctx) {
  try {
    return Validate(ctx).owner_id;
  } catch (const InvalidSessionError&) {
    return std::nullopt;
  } catch (const SecurityViolationError&) {
    return std::nullopt;
  }
}

bool SessionProtocol::IsAuthenticated(RequestContext& ctx) { return GetOwnerId(ctx).has_value(); }

std::size_t SessionProtocol::GetActiveSessionCount(RequestContext& ctx) {
  auto session_id = SessionIdFromCookie(ctx);
  if (!session_id) {
    return 0;
  }
  auto record = store_->Read(*session_id);
  if (!record) {
    return 0;
  }
  return store_->CountForOwner(record->owner_id);
}

std::optional<std::string> SessionProtocol::SessionIdFromCookie(const RequestContext& ctx) const {
  auto value = ctx.cookies.Get(config_.cookie_name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

CookieAttributes SessionProtocol::MakeCookieAttributes(TimePoint expires) const {
  CookieAttributes attributes;
  attributes.expires = expires;
  attributes.path = config_.cookie_options.path;
  attributes.domain = config_.cookie_options.domain;
  attributes.secure = config_.cookie_options.secure;
  attributes.http_only = config_.cookie_options.http_only;
  attributes.same_site = config_.cookie_options.same_site;
  return attributes;
}

void SessionProtocol::SetSessionCookie(RequestContext& ctx, const std::string& session_id) const {
  ctx.cookies.Set(config_.cookie_name, session_id, MakeCookieAttributes(clock_() + config_.session_expiry));
}

void SessionProtocol::ClearSessionCookie(RequestContext& ctx) const {
  ctx.cookies.Set(config_.cookie_name, "", MakeCookieAttributes(clock_() - kCookieClearBackdate));
}

void SessionProtocol::LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& owner_id,
                               const std::string& detail) const {
  if (observability_) {
    observability_->LogEvent(level, name, owner_id, detail);
  }
}

}  // namespace dropguard
