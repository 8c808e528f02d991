/*
 * 설명: OpenSSL RAND_bytes 기반 토큰 생성기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/token_generator_test.cpp
 */
#include "dropguard/token_generator.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace dropguard {

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string GenerateToken(std::size_t byte_length) {
  if (byte_length == 0) {
    throw std::invalid_argument("토큰 길이는 1바이트 이상이어야 합니다");
  }
  std::vector<unsigned char> buffer(byte_length);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패: " + std::to_string(ERR_get_error()));
  }
  return BytesToHex(buffer.data(), buffer.size());
}

}  // namespace dropguard
