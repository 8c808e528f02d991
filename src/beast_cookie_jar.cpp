/*
 * 설명: Beast Cookie 헤더를 읽고 응답에 Set-Cookie 필드를 추가한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#include "dropguard/beast_cookie_jar.hpp"

namespace dropguard {

BeastCookieJar::BeastCookieJar(const Request& req, Response& res) : res_(res) {
  // Cookie 헤더가 여러 줄로 오는 경우도 모두 합친다. 앞선 값이 우선한다.
  auto range = req.equal_range(boost::beast::http::field::cookie);
  for (auto it = range.first; it != range.second; ++it) {
    for (auto& entry : ParseCookieHeader(std::string_view(it->value().data(), it->value().size()))) {
      request_cookies_.emplace(entry.first, entry.second);
    }
  }
}

std::optional<std::string> BeastCookieJar::Get(const std::string& name) const {
  auto it = request_cookies_.find(name);
  if (it == request_cookies_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

void BeastCookieJar::Set(const std::string& name, const std::string& value, const CookieAttributes& attributes) {
  res_.insert(boost::beast::http::field::set_cookie, SerializeSetCookie(name, value, attributes));
}

}  // namespace dropguard
