/*
 * 설명: Cookie 헤더 파싱과 Set-Cookie 직렬화, 헤더 기반 쿠키 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/cookie_jar_test.cpp
 */
#include "dropguard/cookie_jar.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dropguard {
namespace {
std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}

std::string ToImfFixdate(TimePoint tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
  return oss.str();
}
}  // namespace

std::unordered_map<std::string, std::string> ParseCookieHeader(std::string_view header) {
  std::unordered_map<std::string, std::string> cookies;
  std::size_t pos = 0;
  while (pos <= header.size()) {
    auto semi = header.find(';', pos);
    auto pair = Trim(header.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && eq > 0) {
      auto name = Trim(pair.substr(0, eq));
      auto value = Trim(pair.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      // 같은 이름이 여러 번 오면 첫 값을 쓴다.
      cookies.emplace(std::string(name), std::string(value));
    }
    if (semi == std::string_view::npos) {
      break;
    }
    pos = semi + 1;
  }
  return cookies;
}

std::string SerializeSetCookie(const std::string& name, const std::string& value,
                               const CookieAttributes& attributes) {
  std::ostringstream oss;
  oss << name << "=" << value;
  oss << "; Expires=" << ToImfFixdate(attributes.expires);
  if (!attributes.path.empty()) {
    oss << "; Path=" << attributes.path;
  }
  if (!attributes.domain.empty()) {
    oss << "; Domain=" << attributes.domain;
  }
  if (attributes.secure) {
    oss << "; Secure";
  }
  if (attributes.http_only) {
    oss << "; HttpOnly";
  }
  if (!attributes.same_site.empty()) {
    oss << "; SameSite=" << attributes.same_site;
  }
  return oss.str();
}

HeaderCookieJar::HeaderCookieJar(std::string_view cookie_header)
    : request_cookies_(ParseCookieHeader(cookie_header)) {}

std::optional<std::string> HeaderCookieJar::Get(const std::string& name) const {
  auto it = request_cookies_.find(name);
  if (it == request_cookies_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

void HeaderCookieJar::Set(const std::string& name, const std::string& value, const CookieAttributes& attributes) {
  set_cookie_headers_.push_back(SerializeSetCookie(name, value, attributes));
  written_.push_back(Written{name, value, attributes});
}

std::optional<std::string> HeaderCookieJar::LastSetValue(const std::string& name) const {
  for (auto it = written_.rbegin(); it != written_.rend(); ++it) {
    if (it->name == name) {
      return it->value;
    }
  }
  return std::nullopt;
}

std::optional<CookieAttributes> HeaderCookieJar::LastSetAttributes(const std::string& name) const {
  for (auto it = written_.rbegin(); it != written_.rend(); ++it) {
    if (it->name == name) {
      return it->attributes;
    }
  }
  return std::nullopt;
}

void HeaderCookieJar::ApplyResponseCookies() {
  for (const auto& written : written_) {
    if (written.value.empty()) {
      request_cookies_.erase(written.name);
    } else {
      request_cookies_[written.name] = written.value;
    }
  }
  set_cookie_headers_.clear();
  written_.clear();
}

}  // namespace dropguard
