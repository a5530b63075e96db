/*
 * 설명: 플릿 전역에서 유일한 방 ID를 만들고 방 레코드를 분산 저장소에 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp, server/tests/it/kv_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "broker/kv_store.hpp"

namespace broker {

inline constexpr const char* kRoomKeyPrefix = "rooms/";

struct RoomRecord {
  std::string id;
  std::string name;
  std::string owner_id;
};

struct RegistryFailure {
  std::string message;
};

using CreateRoomOutcome = std::variant<std::string, RegistryFailure>;
using LookupRoomOutcome = std::variant<std::optional<RoomRecord>, RegistryFailure>;

class RoomRegistry {
 public:
  // instance_id가 비어 있으면 무작위 판별자를 만든다.
  RoomRegistry(std::shared_ptr<KvStore> store, std::string instance_id);
  virtual ~RoomRegistry() = default;

  // owner_id, name이 비어 있지 않다는 전제는 호출자가 보장한다.
  virtual CreateRoomOutcome CreateRoom(const std::string& owner_id, const std::string& name, Deadline deadline);
  virtual LookupRoomOutcome LookupRoom(const std::string& room_id, Deadline deadline);

  std::string GenerateRoomId() const;
  const std::string& InstanceId() const { return instance_id_; }

 protected:
  // 테스트 스텁 전용. 저장소가 없으므로 파생 클래스는 CreateRoom/LookupRoom을 모두 재정의해야 한다.
  RoomRegistry() = default;

 private:
  std::shared_ptr<KvStore> store_;
  std::string instance_id_;
};

}  // namespace broker
