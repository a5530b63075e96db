/*
 * 설명: 방 ID 생성(시간 + 인스턴스 판별자 + 난수)과 조건부 생성 쓰기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp, server/tests/it/kv_store_it_test.cpp
 */
#include "broker/room_registry.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

namespace broker {

namespace {
// 충돌은 쓰기가 일어나지 않았음이 확실한 경우에만 재시도한다.
constexpr std::size_t kMaxIdAttempts = 3;

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string RoomKey(const std::string& room_id) { return std::string{kRoomKeyPrefix} + room_id; }
}  // namespace

RoomRegistry::RoomRegistry(std::shared_ptr<KvStore> store, std::string instance_id)
    : store_(std::move(store)), instance_id_(instance_id.empty() ? RandomHex(4) : std::move(instance_id)) {}

std::string RoomRegistry::GenerateRoomId() const {
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
  std::ostringstream oss;
  oss << "room-" << std::hex << std::setw(16) << std::setfill('0') << nanos << "-" << instance_id_ << "-"
      << RandomHex(8);
  return oss.str();
}

CreateRoomOutcome RoomRegistry::CreateRoom(const std::string& owner_id, const std::string& name, Deadline deadline) {
  try {
    for (std::size_t attempt = 1; attempt <= kMaxIdAttempts; ++attempt) {
      auto room_id = GenerateRoomId();
      nlohmann::json value{{"id", room_id}, {"name", name}, {"ownerId", owner_id}};
      if (store_->PutIfAbsent(RoomKey(room_id), value.dump(), deadline) == PutOutcome::kCreated) {
        return room_id;
      }
    }
    return RegistryFailure{"방 ID 충돌이 반복되어 생성을 중단했습니다"};
  } catch (const StoreError& ex) {
    return RegistryFailure{ex.what()};
  } catch (const std::exception& ex) {
    return RegistryFailure{std::string{"방 생성 실패: "} + ex.what()};
  }
}

LookupRoomOutcome RoomRegistry::LookupRoom(const std::string& room_id, Deadline deadline) {
  try {
    auto stored = store_->Get(RoomKey(room_id), deadline);
    if (!stored) {
      return std::optional<RoomRecord>{};
    }
    auto value = nlohmann::json::parse(*stored);
    RoomRecord record;
    record.id = value.value("id", room_id);
    record.name = value.at("name").get<std::string>();
    record.owner_id = value.value("ownerId", std::string{});
    return std::optional<RoomRecord>{record};
  } catch (const StoreError& ex) {
    return RegistryFailure{ex.what()};
  } catch (const nlohmann::json::exception& ex) {
    return RegistryFailure{std::string{"방 레코드 형식 오류: "} + ex.what()};
  }
}

}  // namespace broker
