/*
 * 설명: 단일 프로세스용 메모리 세션 저장소. 하나의 뮤텍스로 레코드와 소유자 인덱스를 함께 보호한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_session_store_test.cpp
 */
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "dropguard/session_store.hpp"

namespace dropguard {

class MemorySessionStore : public SessionStore {
 public:
  explicit MemorySessionStore(Clock clock = SystemClock());

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
  struct Entry {
    SessionRecord record;
    TimePoint expires_at;
  };

  // 아래 *Locked 함수는 mutex_ 를 잡은 상태에서만 호출한다.
  Entry* FindLiveLocked(const std::string& session_id, TimePoint now);
  void EraseLocked(const std::string& session_id);
  std::size_t PurgeExpiredLocked(TimePoint now);

  Clock clock_;
  std::unordered_map<std::string, Entry> sessions_;
  std::unordered_map<std::string, std::unordered_set<std::string>> owner_sessions_;
  std::mutex mutex_;
};

}  // namespace dropguard
