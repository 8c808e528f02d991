/*
 * 설명: MariaDB(InnoDB) 기반 원격 세션 저장소. 회전은 행 잠금 트랜잭션 하나로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/mariadb_session_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "dropguard/db_client.hpp"
#include "dropguard/session_store.hpp"

namespace dropguard {

// <prefix>sessions: session_id 키, 직렬화된 레코드, 만료 시각(Unix 초)
// <prefix>owner_sessions: owner_id 별 세션 인덱스. 항목 만료는 세션 만료보다 짧지 않다.
class MariaDbSessionStore : public SessionStore {
 public:
  // table_prefix 는 영문자, 숫자, 밑줄만 허용한다.
  MariaDbSessionStore(std::shared_ptr<MariaDbClient> db_client, std::string table_prefix = "dropguard_",
                      Clock clock = SystemClock());

  void EnsureSchema() const;
  // 테스트용. 두 테이블을 비운다.
  void ClearAll() const;

  void Create(const std::string& session_id, const std::string& owner_id, const SessionRecord& record,
              std::chrono::seconds ttl) override;
  std::optional<SessionRecord> Read(const std::string& session_id) override;
  void Delete(const std::string& session_id) override;
  void DeleteAllForOwner(const std::string& owner_id) override;
  void RefreshTtl(const std::string& session_id, std::chrono::seconds ttl) override;
  bool RotateAtomic(const std::string& old_id, const std::string& new_id, const std::string& owner_id,
                    const SessionRecord& payload, std::chrono::seconds ttl) override;
  std::size_t CountForOwner(const std::string& owner_id) override;
  bool UpdateApplicationData(const std::string& session_id, const nlohmann::json& data) override;
  std::size_t PurgeExpired() override;

 private:
  // 살아있는 레코드 본문을 읽는다. for_update 면 트랜잭션 안에서 행을 잠근다.
  std::optional<std::string> SelectRecord(MYSQL* conn, const std::string& session_id, std::int64_t now,
                                          bool for_update) const;
  void UpsertMembership(MYSQL* conn, const std::string& owner_id, const std::string& session_id,
                        std::int64_t expires_at) const;
  void RemoveMembership(MYSQL* conn, const std::string& session_id) const;

  std::string SessionsTable() const { return table_prefix_ + "sessions"; }
  std::string OwnersTable() const { return table_prefix_ + "owner_sessions"; }

  std::shared_ptr<MariaDbClient> db_client_;
  std::string table_prefix_;
  Clock clock_;
};

}  // namespace dropguard
