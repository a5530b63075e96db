#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "broker/room_registry.hpp"
#include "support/test_support.hpp"

namespace {

TEST(RoomRegistryTest, CreateRoomWritesRecordUnderRoomsNamespace) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  broker::RoomRegistry registry(store, "node-a");

  auto outcome = registry.CreateRoom("u1", "lobby", broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<std::string>(outcome));
  auto room_id = std::get<std::string>(outcome);
  EXPECT_FALSE(room_id.empty());
  EXPECT_NE(room_id.find("node-a"), std::string::npos);

  auto data = store->Snapshot();
  ASSERT_EQ(data.size(), 1u);
  auto it = data.find("rooms/" + room_id);
  ASSERT_NE(it, data.end());
  auto value = nlohmann::json::parse(it->second);
  EXPECT_EQ(value["name"], "lobby");
  EXPECT_EQ(value["ownerId"], "u1");
  EXPECT_EQ(value["id"], room_id);
}

TEST(RoomRegistryTest, GeneratesRandomInstanceIdWhenNotConfigured) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  broker::RoomRegistry first(store, "");
  broker::RoomRegistry second(store, "");
  EXPECT_EQ(first.InstanceId().size(), 8u);
  EXPECT_NE(first.InstanceId(), second.InstanceId());
}

TEST(RoomRegistryTest, ConcurrentCreatesAcrossInstancesNeverCollide) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  // 같은 판별자를 쓰는 두 레지스트리도 난수 접미사로 구분되어야 한다.
  std::vector<std::shared_ptr<broker::RoomRegistry>> registries{
      std::make_shared<broker::RoomRegistry>(store, "node-a"), std::make_shared<broker::RoomRegistry>(store, "node-a"),
      std::make_shared<broker::RoomRegistry>(store, "node-b")};

  constexpr int kThreads = 12;
  constexpr int kPerThread = 200;
  std::vector<std::vector<std::string>> ids(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      auto& registry = registries[static_cast<std::size_t>(t) % registries.size()];
      for (int i = 0; i < kPerThread; ++i) {
        auto outcome = registry->CreateRoom("owner", "room", broker_test::FarDeadline());
        if (auto* id = std::get_if<std::string>(&outcome)) {
          ids[static_cast<std::size_t>(t)].push_back(*id);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> unique;
  for (const auto& per_thread : ids) {
    EXPECT_EQ(per_thread.size(), static_cast<std::size_t>(kPerThread));
    unique.insert(per_thread.begin(), per_thread.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(store->put_calls.load(), kThreads * kPerThread);
}

TEST(RoomRegistryTest, StoreFailureIsReturnedWithStoreText) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  store->FailWith("연결 실패: Can't connect to server");
  broker::RoomRegistry registry(store, "node-a");

  auto outcome = registry.CreateRoom("u1", "lobby", broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<broker::RegistryFailure>(outcome));
  EXPECT_EQ(std::get<broker::RegistryFailure>(outcome).message, "연결 실패: Can't connect to server");
  // 결과를 알 수 없는 쓰기는 재시도하지 않는다.
  EXPECT_EQ(store->put_calls.load(), 1);
}

TEST(RoomRegistryTest, ElapsedDeadlineFailsWithoutRetry) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  broker::RoomRegistry registry(store, "node-a");

  auto past = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
  auto outcome = registry.CreateRoom("u1", "lobby", past);
  ASSERT_TRUE(std::holds_alternative<broker::RegistryFailure>(outcome));
  EXPECT_FALSE(std::get<broker::RegistryFailure>(outcome).message.empty());
  EXPECT_EQ(store->put_calls.load(), 1);
  EXPECT_TRUE(store->Snapshot().empty());
}

TEST(RoomRegistryTest, KeyConflictRegeneratesId) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  store->ForceConflicts(2);
  broker::RoomRegistry registry(store, "node-a");

  auto outcome = registry.CreateRoom("u1", "lobby", broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<std::string>(outcome));
  EXPECT_EQ(store->put_calls.load(), 3);
  EXPECT_EQ(store->Snapshot().size(), 1u);
}

TEST(RoomRegistryTest, PersistentConflictGivesUp) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  store->ForceConflicts(100);
  broker::RoomRegistry registry(store, "node-a");

  auto outcome = registry.CreateRoom("u1", "lobby", broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<broker::RegistryFailure>(outcome));
  EXPECT_EQ(store->put_calls.load(), 3);
  EXPECT_TRUE(store->Snapshot().empty());
}

TEST(RoomRegistryTest, LookupReturnsStoredRecord) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  broker::RoomRegistry writer(store, "node-a");
  broker::RoomRegistry reader(store, "node-b");

  auto created = writer.CreateRoom("u1", "lobby", broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<std::string>(created));
  auto room_id = std::get<std::string>(created);

  auto found = reader.LookupRoom(room_id, broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<std::optional<broker::RoomRecord>>(found));
  const auto& record = std::get<std::optional<broker::RoomRecord>>(found);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->id, room_id);
  EXPECT_EQ(record->name, "lobby");
  EXPECT_EQ(record->owner_id, "u1");

  auto missing = reader.LookupRoom("room-unknown", broker_test::FarDeadline());
  ASSERT_TRUE(std::holds_alternative<std::optional<broker::RoomRecord>>(missing));
  EXPECT_FALSE(std::get<std::optional<broker::RoomRecord>>(missing).has_value());
}

TEST(RoomRegistryTest, LookupReportsCorruptRecord) {
  auto store = std::make_shared<broker_test::InMemoryKvStore>();
  store->Put("rooms/room-x", "not-json", broker_test::FarDeadline());
  broker::RoomRegistry registry(store, "node-a");

  auto outcome = registry.LookupRoom("room-x", broker_test::FarDeadline());
  EXPECT_TRUE(std::holds_alternative<broker::RegistryFailure>(outcome));
}

}  // namespace
