/*
 * 설명: MariaDB 세션 저장소를 구현한다. 만료는 expires_at 조건으로 읽기 시점에 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/mariadb_session_store_it_test.cpp
 */
#include "dropguard/mariadb_session_store.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace dropguard {
namespace {
bool IsValidPrefix(const std::string& prefix) {
  return std::all_of(prefix.begin(), prefix.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; });
}

// 손상된 본문은 없는 레코드로 취급한다.
std::optional<nlohmann::json> ParseRecordBody(const std::string& text) {
  auto body = nlohmann::json::parse(text, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return std::nullopt;
  }
  return body;
}

// 요청에서 온 UA 처럼 UTF-8 이 아닌 바이트는 U+FFFD 로 바꿔 저장한다.
std::string DumpRecordBody(const nlohmann::json& body) {
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
}  // namespace

MariaDbSessionStore::MariaDbSessionStore(std::shared_ptr<MariaDbClient> db_client, std::string table_prefix,
                                         Clock clock)
    : db_client_(std::move(db_client)), table_prefix_(std::move(table_prefix)), clock_(std::move(clock)) {
  if (!db_client_) {
    throw std::invalid_argument("MariaDB 클라이언트가 필요합니다");
  }
  if (!IsValidPrefix(table_prefix_)) {
    throw std::invalid_argument("테이블 접두사가 올바르지 않습니다: " + table_prefix_);
  }
}

void MariaDbSessionStore::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sessions;
    sessions << "CREATE TABLE IF NOT EXISTS " << SessionsTable() << " ("
             << "session_id VARCHAR(128) NOT NULL PRIMARY KEY, "
             << "owner_id VARCHAR(255) NOT NULL, "
             << "record MEDIUMTEXT NOT NULL, "
             << "expires_at BIGINT NOT NULL, "
             << "KEY idx_owner (owner_id), "
             << "KEY idx_expires (expires_at)"
             << ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";
    db_client_->Execute(conn, sessions.str(), "세션 테이블 생성 실패");

    std::ostringstream owners;
    owners << "CREATE TABLE IF NOT EXISTS " << OwnersTable() << " ("
           << "owner_id VARCHAR(255) NOT NULL, "
           << "session_id VARCHAR(128) NOT NULL, "
           << "expires_at BIGINT NOT NULL, "
           << "PRIMARY KEY (owner_id, session_id), "
           << "KEY idx_session (session_id)"
           << ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";
    db_client_->Execute(conn, owners.str(), "소유자 인덱스 테이블 생성 실패");
  });
}

void MariaDbSessionStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM " + SessionsTable() + ";", "세션 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM " + OwnersTable() + ";", "소유자 인덱스 초기화 실패");
  });
}

void MariaDbSessionStore::Create(const std::string& session_id, const std::string& owner_id,
                                 const SessionRecord& record, std::chrono::seconds ttl) {
  auto now = clock_();
  SessionRecord stored = record;
  stored.session_id = session_id;
  stored.owner_id = owner_id;
  stored.last_activity_at = now;
  auto expires_at = ToUnixSeconds(now + ttl);
  auto body = DumpRecordBody(SessionRecordToJson(stored));

  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto id = db_client_->Escape(conn, session_id);
    auto owner = db_client_->Escape(conn, owner_id);

    std::ostringstream stale;
    stale << "DELETE FROM " << OwnersTable() << " WHERE session_id='" << id << "' AND owner_id<>'" << owner << "';";
    db_client_->Execute(conn, stale.str(), "이전 소유자 인덱스 정리 실패");

    std::ostringstream upsert;
    upsert << "INSERT INTO " << SessionsTable() << "(session_id, owner_id, record, expires_at) VALUES('" << id
           << "', '" << owner << "', '" << db_client_->Escape(conn, body) << "', " << expires_at
           << ") ON DUPLICATE KEY UPDATE owner_id=VALUES(owner_id), record=VALUES(record), "
           << "expires_at=VALUES(expires_at);";
    db_client_->Execute(conn, upsert.str(), "세션 저장 실패");

    UpsertMembership(conn, owner_id, session_id, expires_at);
    return true;
  });
}

std::optional<SessionRecord> MariaDbSessionStore::Read(const std::string& session_id) {
  auto now = ToUnixSeconds(clock_());
  std::optional<std::string> text;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { text = SelectRecord(conn, session_id, now, false); });
  if (!text) {
    return std::nullopt;
  }
  auto body = ParseRecordBody(*text);
  if (!body) {
    return std::nullopt;
  }
  try {
    return SessionRecordFromJson(session_id, *body);
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

void MariaDbSessionStore::Delete(const std::string& session_id) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto id = db_client_->Escape(conn, session_id);
    db_client_->Execute(conn, "DELETE FROM " + SessionsTable() + " WHERE session_id='" + id + "';",
                        "세션 삭제 실패");
    RemoveMembership(conn, session_id);
    return true;
  });
}

void MariaDbSessionStore::DeleteAllForOwner(const std::string& owner_id) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto owner = db_client_->Escape(conn, owner_id);
    std::ostringstream indexed;
    indexed << "DELETE s FROM " << SessionsTable() << " s JOIN " << OwnersTable()
            << " o ON o.session_id = s.session_id WHERE o.owner_id='" << owner << "';";
    db_client_->Execute(conn, indexed.str(), "소유자 세션 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM " + SessionsTable() + " WHERE owner_id='" + owner + "';",
                        "소유자 세션 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM " + OwnersTable() + " WHERE owner_id='" + owner + "';",
                        "소유자 인덱스 삭제 실패");
    return true;
  });
}

void MariaDbSessionStore::RefreshTtl(const std::string& session_id, std::chrono::seconds ttl) {
  auto now_tp = clock_();
  auto now = ToUnixSeconds(now_tp);
  auto expires_at = ToUnixSeconds(now_tp + ttl);
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto text = SelectRecord(conn, session_id, now, true);
    if (!text) {
      return false;
    }
    auto body = ParseRecordBody(*text);
    if (!body) {
      return false;
    }
    auto last = body->value("lastActivityAt", std::int64_t{0});
    (*body)["lastActivityAt"] = std::max(last, now);

    auto id = db_client_->Escape(conn, session_id);
    std::ostringstream update;
    update << "UPDATE " << SessionsTable() << " SET record='" << db_client_->Escape(conn, DumpRecordBody(*body))
           << "', expires_at=" << expires_at << " WHERE session_id='" << id << "';";
    db_client_->Execute(conn, update.str(), "세션 TTL 갱신 실패");

    std::ostringstream member;
    member << "UPDATE " << OwnersTable() << " SET expires_at=GREATEST(expires_at, " << expires_at
           << ") WHERE session_id='" << id << "';";
    db_client_->Execute(conn, member.str(), "소유자 인덱스 TTL 갱신 실패");
    return true;
  });
}

bool MariaDbSessionStore::RotateAtomic(const std::string& old_id, const std::string& new_id,
                                       const std::string& owner_id, const SessionRecord& payload,
                                       std::chrono::seconds ttl) {
  auto now_tp = clock_();
  auto now = ToUnixSeconds(now_tp);
  auto expires_at = ToUnixSeconds(now_tp + ttl);

  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    // 행 잠금으로 같은 old_id 에 대한 동시 회전을 직렬화한다. 패자는 잠금이 풀린 뒤 행이 없음을 보게 된다.
    auto text = SelectRecord(conn, old_id, now, true);
    if (!text) {
      // 커밋 도중 연결이 끊겨 재시도된 경우 앞선 시도가 이미 반영됐을 수 있다.
      auto installed = SelectRecord(conn, new_id, now, false);
      auto installed_body = installed ? ParseRecordBody(*installed) : std::nullopt;
      return installed_body && installed_body->value("ownerId", std::string{}) == owner_id;
    }
    auto old_body = ParseRecordBody(*text);
    if (!old_body || old_body->value("ownerId", std::string{}) != owner_id) {
      return false;
    }

    SessionRecord rotated = payload;
    rotated.session_id = new_id;
    rotated.owner_id = owner_id;
    rotated.created_at = FromUnixSeconds(old_body->value("createdAt", ToUnixSeconds(payload.created_at)));
    rotated.last_activity_at = FromUnixSeconds(std::max(old_body->value("lastActivityAt", now), now));
    auto body = DumpRecordBody(SessionRecordToJson(rotated));

    auto old_key = db_client_->Escape(conn, old_id);
    auto new_key = db_client_->Escape(conn, new_id);
    auto owner = db_client_->Escape(conn, owner_id);

    std::ostringstream insert;
    insert << "INSERT INTO " << SessionsTable() << "(session_id, owner_id, record, expires_at) VALUES('" << new_key
           << "', '" << owner << "', '" << db_client_->Escape(conn, body) << "', " << expires_at << ");";
    db_client_->Execute(conn, insert.str(), "회전 세션 저장 실패");
    UpsertMembership(conn, owner_id, new_id, expires_at);

    db_client_->Execute(conn, "DELETE FROM " + SessionsTable() + " WHERE session_id='" + old_key + "';",
                        "이전 세션 삭제 실패");
    RemoveMembership(conn, old_id);
    return true;
  });
}

std::size_t MariaDbSessionStore::CountForOwner(const std::string& owner_id) {
  auto now = ToUnixSeconds(clock_());
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT COUNT(*) FROM " << OwnersTable() << " WHERE owner_id='" << db_client_->Escape(conn, owner_id)
        << "' AND expires_at > " << now << ";";
    auto value = db_client_->QueryScalar(conn, sql.str(), "세션 수 집계 실패");
    if (value) {
      count = static_cast<std::size_t>(std::stoull(*value));
    }
  });
  return count;
}

bool MariaDbSessionStore::UpdateApplicationData(const std::string& session_id, const nlohmann::json& data) {
  auto now = ToUnixSeconds(clock_());
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto text = SelectRecord(conn, session_id, now, true);
    if (!text) {
      return false;
    }
    auto body = ParseRecordBody(*text);
    if (!body || !body->contains("data") || !(*body)["data"].is_object()) {
      return false;
    }
    (*body)["data"]["userData"] = data;

    std::ostringstream update;
    update << "UPDATE " << SessionsTable() << " SET record='" << db_client_->Escape(conn, DumpRecordBody(*body))
           << "' WHERE session_id='" << db_client_->Escape(conn, session_id) << "';";
    db_client_->Execute(conn, update.str(), "세션 데이터 갱신 실패");
    return true;
  });
}

std::size_t MariaDbSessionStore::PurgeExpired() {
  auto now = ToUnixSeconds(clock_());
  std::uint64_t removed = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream sessions;
    sessions << "DELETE FROM " << SessionsTable() << " WHERE expires_at <= " << now << ";";
    removed = db_client_->Execute(conn, sessions.str(), "만료 세션 정리 실패");

    std::ostringstream owners;
    owners << "DELETE FROM " << OwnersTable() << " WHERE expires_at <= " << now << ";";
    db_client_->Execute(conn, owners.str(), "만료 인덱스 정리 실패");
    return true;
  });
  return static_cast<std::size_t>(removed);
}

std::optional<std::string> MariaDbSessionStore::SelectRecord(MYSQL* conn, const std::string& session_id,
                                                             std::int64_t now, bool for_update) const {
  std::ostringstream sql;
  sql << "SELECT record FROM " << SessionsTable() << " WHERE session_id='" << db_client_->Escape(conn, session_id)
      << "' AND expires_at > " << now << (for_update ? " FOR UPDATE;" : ";");
  return db_client_->QueryScalar(conn, sql.str(), "세션 조회 실패");
}

void MariaDbSessionStore::UpsertMembership(MYSQL* conn, const std::string& owner_id, const std::string& session_id,
                                           std::int64_t expires_at) const {
  std::ostringstream sql;
  sql << "INSERT INTO " << OwnersTable() << "(owner_id, session_id, expires_at) VALUES('"
      << db_client_->Escape(conn, owner_id) << "', '" << db_client_->Escape(conn, session_id) << "', " << expires_at
      << ") ON DUPLICATE KEY UPDATE expires_at=GREATEST(expires_at, VALUES(expires_at));";
  db_client_->Execute(conn, sql.str(), "소유자 인덱스 저장 실패");
}

void MariaDbSessionStore::RemoveMembership(MYSQL* conn, const std::string& session_id) const {
  db_client_->Execute(conn,
                      "DELETE FROM " + OwnersTable() + " WHERE session_id='" + db_client_->Escape(conn, session_id) +
                          "';",
                      "소유자 인덱스 삭제 실패");
}

}  // namespace dropguard
