/*
 * 설명: 구조화 로그와 세션 프로토콜 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace dropguard {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 info 로 취급한다.
LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> owner_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t logins{0};
  std::uint64_t rotations{0};
  std::uint64_t rotation_conflicts{0};
  std::uint64_t security_violations{0};
  std::uint64_t security_advisories{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementLogin();
  void IncrementRotation();
  void IncrementRotationConflict();
  void IncrementSecurityViolation();
  void IncrementSecurityAdvisory();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& owner_id,
                const std::string& detail) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> logins_{0};
  std::atomic<std::uint64_t> rotations_{0};
  std::atomic<std::uint64_t> rotation_conflicts_{0};
  std::atomic<std::uint64_t> security_violations_{0};
  std::atomic<std::uint64_t> security_advisories_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace dropguard
