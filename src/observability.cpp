/*
 * 설명: 구조화 로그와 세션 프로토콜 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/observability_test.cpp
 */
#include "dropguard/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace dropguard {

LogLevel ParseLogLevel(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementLogin() { logins_.fetch_add(1); }

void Observability::IncrementRotation() { rotations_.fetch_add(1); }

void Observability::IncrementRotationConflict() { rotation_conflicts_.fetch_add(1); }

void Observability::IncrementSecurityViolation() { security_violations_.fetch_add(1); }

void Observability::IncrementSecurityAdvisory() { security_advisories_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.logins = logins_.load();
  snapshot.rotations = rotations_.load();
  snapshot.rotation_conflicts = rotation_conflicts_.load();
  snapshot.security_violations = security_violations_.load();
  snapshot.security_advisories = security_advisories_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (static_cast<int>(ctx.level) < static_cast<int>(min_level_)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.owner_id) {
    log_json["ownerId"] = *ctx.owner_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  // 요청 경로 같은 외부 입력이 UTF-8 이 아니어도 로그 한 줄은 남긴다.
  *sink_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& owner_id,
                             const std::string& detail) const {
  LogContext ctx;
  ctx.owner_id = owner_id;
  ctx.name = name;
  ctx.level = level;
  ctx.detail = detail;
  Log(ctx);
}

}  // namespace dropguard
