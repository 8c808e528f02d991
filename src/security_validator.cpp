/*
 * 설명: IP 정확 비교와 User-Agent 유사도 비교를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/security_validator_test.cpp
 */
#include "dropguard/security_validator.hpp"

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

namespace dropguard {
namespace {
const std::regex& VersionSegmentPattern() {
  static const std::regex pattern(R"(/(\d+)\.[\d.]+)");
  return pattern;
}

// 최장 공통 부분 수열 길이. 두 행만 유지하는 O(n*m) 동적 계획법.
std::size_t CommonCharacters(const std::string& a, const std::string& b) {
  std::vector<std::size_t> prev(b.size() + 1, 0);
  std::vector<std::size_t> curr(b.size() + 1, 0);
  for (std::size_t i = 1; i <= a.size(); ++i) {
    for (std::size_t j = 1; j <= b.size(); ++j) {
      curr[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : std::max(prev[j], curr[j - 1]);
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

double OverlapSimilarity(const std::string& full_a, const std::string& full_b) {
  auto a = full_a.substr(0, kMaxOverlapLength);
  auto b = full_b.substr(0, kMaxOverlapLength);
  auto total = a.size() + b.size();
  if (total == 0) {
    return 1.0;
  }
  auto common = CommonCharacters(a, b);
  return static_cast<double>(common * 2) / static_cast<double>(total);
}

std::string FormatScore(double score) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << score;
  return oss.str();
}
}  // namespace

std::string NormalizeUserAgent(const std::string& user_agent) {
  return std::regex_replace(user_agent, VersionSegmentPattern(), "/$1");
}

std::size_t LevenshteinDistance(const std::string& a, const std::string& b) {
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> curr(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    prev[j] = j;
  }
  for (std::size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      std::size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, substitution});
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

double CalculateUaSimilarity(const std::string& ua1, const std::string& ua2) {
  auto left = NormalizeUserAgent(ua1);
  auto right = NormalizeUserAgent(ua2);

  auto max_len = std::max(left.size(), right.size());
  if (max_len == 0) {
    return 1.0;
  }
  if (left.size() > kMaxEditDistanceLength || right.size() > kMaxEditDistanceLength) {
    return OverlapSimilarity(left, right);
  }
  auto distance = LevenshteinDistance(left, right);
  return 1.0 - static_cast<double>(distance) / static_cast<double>(max_len);
}

SecurityVerdict ValidateSecurityContext(const SecurityFingerprint& stored, const SecurityFingerprint& current,
                                        bool strict_ip, bool strict_ua) {
  SecurityVerdict verdict;

  if (stored.origin_ip && !stored.origin_ip->empty()) {
    auto current_ip = current.origin_ip.value_or("");
    if (current_ip != *stored.origin_ip) {
      verdict.warnings.push_back("IP change: " + *stored.origin_ip + " -> " +
                                 (current_ip.empty() ? std::string("unknown") : current_ip));
      if (strict_ip) {
        verdict.valid = false;
      }
    }
  }

  if (stored.user_agent && !stored.user_agent->empty()) {
    auto current_ua = current.user_agent.value_or("");
    if (current_ua != *stored.user_agent) {
      auto similarity = CalculateUaSimilarity(*stored.user_agent, current_ua);
      if (similarity < kUaSimilarityThreshold) {
        verdict.warnings.push_back("UA change detected (similarity: " + FormatScore(similarity) + ")");
        if (strict_ua) {
          verdict.valid = false;
        }
      }
    }
  }

  return verdict;
}

}  // namespace dropguard
