/*
 * 설명: 세션 쿠키 전송 계층 인터페이스와 프레임워크 중립 헤더 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/cookie_jar_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dropguard/session_record.hpp"

namespace dropguard {

struct CookieAttributes {
  TimePoint expires{};
  std::string path{"/"};
  std::string domain;
  bool secure{true};
  bool http_only{true};
  std::string same_site{"Strict"};
};

// 요청 하나에 대한 쿠키 읽기/쓰기. 엔진은 구체 타입을 검사하지 않는다.
class CookieJar {
 public:
  virtual ~CookieJar() = default;
  virtual std::optional<std::string> Get(const std::string& name) const = 0;
  virtual void Set(const std::string& name, const std::string& value, const CookieAttributes& attributes) = 0;
};

std::unordered_map<std::string, std::string> ParseCookieHeader(std::string_view header);

std::string SerializeSetCookie(const std::string& name, const std::string& value,
                               const CookieAttributes& attributes);

// 원시 Cookie 헤더 문자열을 읽고 Set-Cookie 헤더 줄을 모은다.
class HeaderCookieJar : public CookieJar {
 public:
  HeaderCookieJar() = default;
  explicit HeaderCookieJar(std::string_view cookie_header);

  std::optional<std::string> Get(const std::string& name) const override;
  void Set(const std::string& name, const std::string& value, const CookieAttributes& attributes) override;

  const std::vector<std::string>& SetCookieHeaders() const { return set_cookie_headers_; }
  std::optional<std::string> LastSetValue(const std::string& name) const;
  std::optional<CookieAttributes> LastSetAttributes(const std::string& name) const;

  // 클라이언트가 응답을 반영한 것처럼 마지막 Set 값을 다음 요청의 쿠키로 옮긴다.
  void ApplyResponseCookies();

 private:
  struct Written {
    std::string name;
    std::string value;
    CookieAttributes attributes;
  };

  std::unordered_map<std::string, std::string> request_cookies_;
  std::vector<std::string> set_cookie_headers_;
  std::vector<Written> written_;
};

}  // namespace dropguard
