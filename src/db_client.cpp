/*
 * 설명: MariaDB 연결, 단건 조회, 일시 오류 재시도를 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/mariadb_session_store_it_test.cpp
 */
#include "dropguard/db_client.hpp"

#include <chrono>
#include <cstring>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace dropguard {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

void CloseConnection(MYSQL* conn) { mysql_close(conn); }

void FreeResult(MYSQL_RES* res) { mysql_free_result(res); }
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::Connection MariaDbClient::Connect() const {
  Connection conn(mysql_init(nullptr), &CloseConnection);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  // FOR UPDATE 대기는 2초로 제한한다.
  if (mysql_query(conn.get(), "SET SESSION innodb_lock_wait_timeout=2;") != 0) {
    RaiseError(conn.get(), "락 대기 타임아웃 설정 실패");
  }
  return conn;
}

bool MariaDbClient::RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      // 커밋 전에 예외로 빠져나가면 연결이 닫히면서 서버가 트랜잭션을 롤백한다.
      auto conn = Connect();
      if (transactional) {
        mysql_autocommit(conn.get(), 0);
      }
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(conn.get());
      if (!transactional) {
        return commit;
      }
      if (!commit) {
        mysql_rollback(conn.get());
        return false;
      }
      if (mysql_commit(conn.get()) != 0) {
        RaiseError(conn.get(), "커밋 실패");
      }
      return true;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
    }
    Backoff(attempt);
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry(true, work);
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry(false, [&](MYSQL* conn) {
    work(conn);
    return true;
  });
}

std::uint64_t MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
    RaiseError(conn, ctx);
  }
  auto affected = mysql_affected_rows(conn);
  return affected == static_cast<my_ulonglong>(-1) ? 0 : static_cast<std::uint64_t>(affected);
}

std::optional<std::string> MariaDbClient::QueryScalar(MYSQL* conn, const std::string& sql,
                                                      const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
    RaiseError(conn, ctx);
  }
  std::unique_ptr<MYSQL_RES, void (*)(MYSQL_RES*)> res(mysql_store_result(conn), &FreeResult);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row || !row[0]) {
    return std::nullopt;
  }
  unsigned long* lengths = mysql_fetch_lengths(res.get());
  return std::string(row[0], lengths ? lengths[0] : std::strlen(row[0]));
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, &escaped[0], value.c_str(), static_cast<unsigned long>(value.size()));
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryable(code));
}

// 교착, 락 대기 초과, 연결 유실은 같은 작업을 새 연결로 다시 시도한다.
bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, 25);
  auto delay_ms = 50 * (1u << (attempt - 1)) + static_cast<unsigned int>(jitter(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace dropguard
