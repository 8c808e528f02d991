/*
 * 설명: 세션 프로토콜이 호출자에게 드러내는 오류 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_protocol_test.cpp
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dropguard {

class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

enum class InvalidSessionReason {
  kNoCookie,
  kNotFound,
  kConcurrentRotation,
};

// 항상 세션 쿠키 삭제와 함께 발생한다.
class InvalidSessionError : public ProtocolError {
 public:
  InvalidSessionError(const std::string& message, InvalidSessionReason reason)
      : ProtocolError(message), reason(reason) {}
  InvalidSessionReason reason;
};

class SecurityViolationError : public ProtocolError {
 public:
  SecurityViolationError(const std::string& message, std::vector<std::string> warnings)
      : ProtocolError(message), warnings(std::move(warnings)) {}
  std::vector<std::string> warnings;
};

class SessionLimitError : public ProtocolError {
 public:
  SessionLimitError(const std::string& message, std::size_t current, std::size_t max)
      : ProtocolError(message), current(current), max(max) {}
  std::size_t current;
  std::size_t max;
};

// 저장소 백엔드에 도달할 수 없을 때만 발생한다. 인증 판단이 아니라 일시적 인프라 오류로 취급한다.
class StoreUnavailableError : public std::runtime_error {
 public:
  explicit StoreUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace dropguard
