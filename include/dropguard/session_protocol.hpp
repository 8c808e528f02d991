/*
 * 설명: 로그인/검증/회전/로그아웃을 조합하는 세션 프로토콜 엔진. 동시성 안전과 회전 실패 복구를 책임진다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_protocol_test.cpp, tests/e2e/session_http_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "dropguard/config.hpp"
#include "dropguard/cookie_jar.hpp"
#include "dropguard/errors.hpp"
#include "dropguard/observability.hpp"
#include "dropguard/request_context.hpp"
#include "dropguard/session_record.hpp"
#include "dropguard/session_store.hpp"

namespace dropguard {

struct LoginResult {
  std::string session_id;
  std::chrono::seconds expires_in;
};

// 인스턴스는 주입된 저장소와 설정 외에 가변 상태를 갖지 않으므로 여러 요청 스레드에서 공유해도 된다.
// 요청별 상태는 모두 RequestContext 로 전달된다.
class SessionProtocol {
 public:
  SessionProtocol(std::shared_ptr<SessionStore> store, ProtocolConfig config,
                  std::shared_ptr<Observability> observability = nullptr, Clock clock = SystemClock());

  // 다중 세션이 꺼져 있으면 기존 세션을 모두 제거하고, 켜져 있으면 할당량을 검사한다.
  // 할당량 검사는 최종적 일관성이므로 동시 로그인 폭주 시 잠시 상한을 넘을 수 있다.
  LoginResult Login(RequestContext& ctx, const std::string& owner_id,
                    const nlohmann::json& application_data = nlohmann::json::object());

  // 회전이 일어나면 반환 레코드의 session_id 는 새 토큰이다.
  SessionRecord Validate(RequestContext& ctx);

  void Logout(RequestContext& ctx);
  void LogoutAll(RequestContext& ctx);
  bool UpdateApplicationData(RequestContext& ctx, const nlohmann::json& data);

  // InvalidSessionError 와 SecurityViolationError 만 "미인증" 으로 접는다.
  std::optional<std::string> GetOwnerId(RequestContext& ctx);
  bool IsAuthenticated(RequestContext& ctx);
  std::size_t GetActiveSessionCount(RequestContext& ctx);

  const ProtocolConfig& GetConfig() const { return config_; }

 private:
  std::optional<std::string> SessionIdFromCookie(const RequestContext& ctx) const;
  CookieAttributes MakeCookieAttributes(TimePoint expires) const;
  void SetSessionCookie(RequestContext& ctx, const std::string& session_id) const;
  void ClearSessionCookie(RequestContext& ctx) const;
  void LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& owner_id,
                const std::string& detail = {}) const;

  std::shared_ptr<SessionStore> store_;
  ProtocolConfig config_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
};

}  // namespace dropguard
