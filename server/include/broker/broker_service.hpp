/*
 * 설명: Authenticate/CreateRoom/SelectQoS 세 연산을 조율하고 결과를 응답 값으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broker_service_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "broker/credential_validator.hpp"
#include "broker/observability.hpp"
#include "broker/qos_policy.hpp"
#include "broker/room_registry.hpp"

namespace broker {

inline constexpr const char* kCreateRoomFieldsRequired = "userId and roomName required";
inline constexpr const char* kRoomIdRequired = "roomId required";

struct AuthenticateResponse {
  bool valid{false};
  std::string user_id;
  std::string error;
};

struct CreateRoomResponse {
  std::string room_id;
  std::string error;
};

struct SelectQosResponse {
  bool accepted{false};
  std::string error;
};

struct LookupRoomResponse {
  bool found{false};
  RoomRecord room;
  std::string error;
};

// 비즈니스 거절은 모두 응답 값으로 돌려주며 예외를 던지지 않는다.
class BrokerService {
 public:
  BrokerService(std::shared_ptr<CredentialValidator> validator, std::shared_ptr<RoomRegistry> registry,
                std::shared_ptr<QosPolicyEngine> policy);

  void SetObservability(std::shared_ptr<Observability> observability) { observability_ = std::move(observability); }

  AuthenticateResponse Authenticate(const std::string& token, const std::string& trace_id = {}) const;
  CreateRoomResponse CreateRoom(const std::string& user_id, const std::string& room_name, Deadline deadline,
                                const std::string& trace_id = {}) const;
  SelectQosResponse SelectQos(const std::string& room_id, std::int32_t bandwidth_kb, std::int32_t latency_ms,
                              const std::string& trace_id = {}) const;
  LookupRoomResponse LookupRoom(const std::string& room_id, Deadline deadline, const std::string& trace_id = {}) const;

 private:
  void LogEvent(LogLevel level, const std::string& name, const std::string& trace_id,
                std::optional<std::string> user_id, std::optional<std::string> room_id,
                const std::string& message) const;

  std::shared_ptr<CredentialValidator> validator_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<QosPolicyEngine> policy_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
