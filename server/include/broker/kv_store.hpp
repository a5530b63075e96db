/*
 * 설명: 플릿 전체가 공유하는 키-값 저장소 인터페이스와 MariaDB 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/kv_store_it_test.cpp, server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "broker/db_client.hpp"

namespace broker {

enum class PutOutcome { kCreated, kExists };

// 구현체는 여러 요청 스레드에서 동시에 호출된다. 실패는 StoreError로 알린다.
class KvStore {
 public:
  virtual ~KvStore() = default;

  virtual void Ping(Deadline deadline) = 0;
  virtual void Put(const std::string& key, const std::string& value, Deadline deadline) = 0;
  virtual PutOutcome PutIfAbsent(const std::string& key, const std::string& value, Deadline deadline) = 0;
  virtual std::optional<std::string> Get(const std::string& key, Deadline deadline) = 0;
};

class MariaDbKvStore : public KvStore {
 public:
  explicit MariaDbKvStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema(Deadline deadline);

  void Ping(Deadline deadline) override;
  void Put(const std::string& key, const std::string& value, Deadline deadline) override;
  PutOutcome PutIfAbsent(const std::string& key, const std::string& value, Deadline deadline) override;
  std::optional<std::string> Get(const std::string& key, Deadline deadline) override;

  // 통합 테스트용. 주어진 접두사의 키를 모두 지운다.
  void ClearPrefix(const std::string& prefix, Deadline deadline);

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace broker
