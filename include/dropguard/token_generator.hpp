/*
 * 설명: 세션 토큰으로 쓰이는 암호학적 난수 16진 문자열을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/token_generator_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace dropguard {

constexpr std::size_t kDefaultTokenBytes = 32;

// 반환 길이는 byte_length * 2 이다. CSPRNG 실패 시 std::runtime_error 를 던진다.
std::string GenerateToken(std::size_t byte_length = kDefaultTokenBytes);

std::string BytesToHex(const unsigned char* data, std::size_t len);

}  // namespace dropguard
