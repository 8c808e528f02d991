/*
 * 설명: 메모리 세션 저장소를 구현한다. 만료는 읽기 경로에서 지연 처리하고 생성/집계 시 일괄 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_session_store_test.cpp
 */
#include "dropguard/memory_session_store.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace dropguard {

MemorySessionStore::MemorySessionStore(Clock clock) : clock_(std::move(clock)) {}

void MemorySessionStore::Create(const std::string& session_id, const std::string& owner_id,
                                const SessionRecord& record, std::chrono::seconds ttl) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  PurgeExpiredLocked(now);

  auto existing = sessions_.find(session_id);
  if (existing != sessions_.end() && existing->second.record.owner_id != owner_id) {
    EraseLocked(session_id);
  }

  Entry entry{record, now + ttl};
  entry.record.session_id = session_id;
  entry.record.owner_id = owner_id;
  entry.record.last_activity_at = now;
  sessions_[session_id] = std::move(entry);
  owner_sessions_[owner_id].insert(session_id);
}

std::optional<SessionRecord> MemorySessionStore::Read(const std::string& session_id) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto* entry = FindLiveLocked(session_id, now);
  if (!entry) {
    return std::nullopt;
  }
  return entry->record;
}

void MemorySessionStore::Delete(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EraseLocked(session_id);
}

void MemorySessionStore::DeleteAllForOwner(const std::string& owner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = owner_sessions_.find(owner_id);
  if (it == owner_sessions_.end()) {
    return;
  }
  for (const auto& session_id : it->second) {
    sessions_.erase(session_id);
  }
  owner_sessions_.erase(it);
}

void MemorySessionStore::RefreshTtl(const std::string& session_id, std::chrono::seconds ttl) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto* entry = FindLiveLocked(session_id, now);
  if (!entry) {
    return;
  }
  entry->expires_at = now + ttl;
  entry->record.last_activity_at = std::max(entry->record.last_activity_at, now);
}

bool MemorySessionStore::RotateAtomic(const std::string& old_id, const std::string& new_id,
                                      const std::string& owner_id, const SessionRecord& payload,
                                      std::chrono::seconds ttl) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto* old_entry = FindLiveLocked(old_id, now);
  if (!old_entry) {
    auto* installed = FindLiveLocked(new_id, now);
    return installed && installed->record.owner_id == owner_id;
  }
  if (old_entry->record.owner_id != owner_id) {
    return false;
  }

  Entry rotated{payload, now + ttl};
  rotated.record.session_id = new_id;
  rotated.record.owner_id = owner_id;
  rotated.record.created_at = old_entry->record.created_at;
  rotated.record.last_activity_at = std::max(old_entry->record.last_activity_at, now);

  EraseLocked(old_id);
  sessions_[new_id] = std::move(rotated);
  owner_sessions_[owner_id].insert(new_id);
  return true;
}

std::size_t MemorySessionStore::CountForOwner(const std::string& owner_id) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  PurgeExpiredLocked(now);
  auto it = owner_sessions_.find(owner_id);
  return it == owner_sessions_.end() ? 0 : it->second.size();
}

bool MemorySessionStore::UpdateApplicationData(const std::string& session_id, const nlohmann::json& data) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto* entry = FindLiveLocked(session_id, now);
  if (!entry) {
    return false;
  }
  entry->record.application_data = data;
  return true;
}

std::size_t MemorySessionStore::PurgeExpired() {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  return PurgeExpiredLocked(now);
}

MemorySessionStore::Entry* MemorySessionStore::FindLiveLocked(const std::string& session_id, TimePoint now) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  if (it->second.expires_at <= now) {
    EraseLocked(session_id);
    return nullptr;
  }
  return &it->second;
}

void MemorySessionStore::EraseLocked(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return;
  }
  auto owner_it = owner_sessions_.find(it->second.record.owner_id);
  if (owner_it != owner_sessions_.end()) {
    owner_it->second.erase(session_id);
    if (owner_it->second.empty()) {
      owner_sessions_.erase(owner_it);
    }
  }
  sessions_.erase(it);
}

std::size_t MemorySessionStore::PurgeExpiredLocked(TimePoint now) {
  std::vector<std::string> expired;
  for (const auto& [session_id, entry] : sessions_) {
    if (entry.expires_at <= now) {
      expired.push_back(session_id);
    }
  }
  for (const auto& session_id : expired) {
    EraseLocked(session_id);
  }
  return expired.size();
}

}  // namespace dropguard
