/*
 * 설명: 세션 저장소 백엔드가 지켜야 할 계약(원자적 회전, 소유자 인덱스, TTL)을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_session_store_test.cpp, tests/it/mariadb_session_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "dropguard/session_record.hpp"

namespace dropguard {

// 예상 가능한 부재는 bool/optional 로 보고하고, 백엔드 접근 불가만 StoreUnavailableError 로 던진다.
// 구현체는 여러 요청 스레드에서 동시에 호출된다.
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  // 멱등 upsert. record.created_at 을 보존하고 last_activity_at 은 저장 시각으로 설정한다.
  // owner 인덱스 항목의 만료는 ttl 보다 짧지 않다.
  virtual void Create(const std::string& session_id, const std::string& owner_id, const SessionRecord& record,
                      std::chrono::seconds ttl) = 0;

  // 논리적으로 만료된 레코드는 물리적 삭제 시점과 무관하게 nullopt 이다.
  virtual std::optional<SessionRecord> Read(const std::string& session_id) = 0;

  virtual void Delete(const std::string& session_id) = 0;

  // 동시에 생성되는 세션과의 선형화는 보장하지 않는다.
  virtual void DeleteAllForOwner(const std::string& owner_id) = 0;

  // 만료를 연장하고 last_activity_at 을 갱신한다. 없으면 아무것도 하지 않는다.
  virtual void RefreshTtl(const std::string& session_id, std::chrono::seconds ttl) = 0;

  // old_id 에 대한 다른 연산과 분리 불가능한 한 단계로 수행한다:
  // 살아있는 레코드 존재와 소유자 일치를 확인하고, 실패하면 아무 변경 없이 false.
  // 성공하면 created_at 을 보존한 새 레코드를 new_id 로 설치하고 old_id 를 제거한다.
  // old_id 가 없어도 new_id 가 같은 소유자로 이미 설치돼 있으면 같은 회전의 재시도이므로 true.
  virtual bool RotateAtomic(const std::string& old_id, const std::string& new_id, const std::string& owner_id,
                            const SessionRecord& payload, std::chrono::seconds ttl) = 0;

  // 최선의 일관성. 완료된 회전으로 제거된 세션을 중복 집계하지 않는다.
  virtual std::size_t CountForOwner(const std::string& owner_id) = 0;

  // application_data 만 교체한다. TTL 과 다른 필드는 유지한다.
  virtual bool UpdateApplicationData(const std::string& session_id, const nlohmann::json& data) = 0;

  // 만료된 레코드와 인덱스 항목을 즉시 정리하고 제거한 레코드 수를 돌려준다.
  virtual std::size_t PurgeExpired() = 0;
};

}  // namespace dropguard
