/*
 * 설명: 세션 저장소가 쓰는 MariaDB 연결, 단건 조회, 재시도 실행기를 정의한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/mariadb_session_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "dropguard/errors.hpp"

namespace dropguard {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

// 재시도 후에도 남은 DB 오류는 저장소 접근 불가로 전파된다.
class DbException : public StoreUnavailableError {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : StoreUnavailableError(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work 가 true 를 돌려주면 커밋, false 면 롤백한다.
  // 커밋 도중 연결이 끊겨도 처음부터 다시 수행하므로 work 는 이미 반영된 상태에서 재실행돼도 같은 결과를 내야 한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  // 자동 커밋 연결에서 work 를 수행한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // 실패 시 RaiseError 로 예외를 던지고, 성공 시 영향받은 행 수를 돌려준다.
  std::uint64_t Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  // 첫 행 첫 열. 행이 없거나 NULL 이면 nullopt.
  std::optional<std::string> QueryScalar(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  using Connection = std::unique_ptr<MYSQL, void (*)(MYSQL*)>;

  Connection Connect() const;
  bool RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace dropguard
