/*
 * 설명: Boost.Beast 요청/응답에 바인딩된 쿠키 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/http.hpp>

#include "dropguard/cookie_jar.hpp"

namespace dropguard {

class BeastCookieJar : public CookieJar {
 public:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  // 요청과 응답은 jar 보다 오래 살아야 한다.
  BeastCookieJar(const Request& req, Response& res);

  std::optional<std::string> Get(const std::string& name) const override;
  void Set(const std::string& name, const std::string& value, const CookieAttributes& attributes) override;

 private:
  std::unordered_map<std::string, std::string> request_cookies_;
  Response& res_;
};

}  // namespace dropguard
