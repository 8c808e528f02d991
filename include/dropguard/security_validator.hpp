/*
 * 설명: 저장된 보안 지문(IP, User-Agent)과 현재 요청을 비교해 판정과 경고 목록을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/security_validator_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "dropguard/session_record.hpp"

namespace dropguard {

constexpr double kUaSimilarityThreshold = 0.8;
constexpr std::size_t kMaxEditDistanceLength = 255;
// 공통 문자 비율은 앞쪽 이 길이까지만 비교한다.
constexpr std::size_t kMaxOverlapLength = 2048;

struct SecurityVerdict {
  bool valid{true};
  std::vector<std::string> warnings;
};

// IP 와 UA 검사는 서로 독립적이며 둘 다 수행한 뒤 경고를 모아 돌려준다.
// strict 가 꺼진 항목의 불일치는 경고만 남기고 valid 에 영향을 주지 않는다.
SecurityVerdict ValidateSecurityContext(const SecurityFingerprint& stored, const SecurityFingerprint& current,
                                        bool strict_ip, bool strict_ua);

// "/120.0.6099.71" 같은 버전 세그먼트를 "/120" 으로 줄인다.
std::string NormalizeUserAgent(const std::string& user_agent);

// 정규화 후 [0.0, 1.0] 유사도. 255자 이하면 편집 거리, 초과하면 공통 부분 수열 비율을 쓴다.
double CalculateUaSimilarity(const std::string& ua1, const std::string& ua2);

std::size_t LevenshteinDistance(const std::string& a, const std::string& b);

}  // namespace dropguard
