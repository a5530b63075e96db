/*
 * 설명: 브로커 연산을 각 구성요소에 위임하고 결과를 응답 구조체로 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broker_service_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#include "broker/broker_service.hpp"

#include <variant>

namespace broker {

BrokerService::BrokerService(std::shared_ptr<CredentialValidator> validator, std::shared_ptr<RoomRegistry> registry,
                             std::shared_ptr<QosPolicyEngine> policy)
    : validator_(std::move(validator)), registry_(std::move(registry)), policy_(std::move(policy)) {}

AuthenticateResponse BrokerService::Authenticate(const std::string& token, const std::string& trace_id) const {
  AuthenticateResponse response;
  auto outcome = validator_->Validate(token);
  if (auto* identity = std::get_if<Identity>(&outcome)) {
    response.valid = true;
    response.user_id = identity->user_id;
    LogEvent(LogLevel::kDebug, "authenticate", trace_id, identity->user_id, std::nullopt, "");
    return response;
  }
  response.error = std::get<AuthFailure>(outcome).reason;
  if (observability_) {
    observability_->IncrementAuthFailure();
  }
  LogEvent(LogLevel::kInfo, "authenticate_rejected", trace_id, std::nullopt, std::nullopt, response.error);
  return response;
}

CreateRoomResponse BrokerService::CreateRoom(const std::string& user_id, const std::string& room_name,
                                             Deadline deadline, const std::string& trace_id) const {
  CreateRoomResponse response;
  if (user_id.empty() || room_name.empty()) {
    response.error = kCreateRoomFieldsRequired;
    return response;
  }
  auto outcome = registry_->CreateRoom(user_id, room_name, deadline);
  if (auto* failure = std::get_if<RegistryFailure>(&outcome)) {
    response.error = failure->message.empty() ? std::string{"저장소 오류"} : failure->message;
    if (observability_) {
      observability_->IncrementRegistryFailure();
    }
    LogEvent(LogLevel::kWarn, "create_room_failed", trace_id, user_id, std::nullopt, response.error);
    return response;
  }
  response.room_id = std::get<std::string>(outcome);
  if (observability_) {
    observability_->IncrementRoomsCreated();
  }
  LogEvent(LogLevel::kInfo, "room_created", trace_id, user_id, response.room_id, "");
  return response;
}

SelectQosResponse BrokerService::SelectQos(const std::string& room_id, std::int32_t bandwidth_kb,
                                           std::int32_t latency_ms, const std::string& trace_id) const {
  SelectQosResponse response;
  if (room_id.empty()) {
    response.error = kRoomIdRequired;
    return response;
  }
  auto decision = policy_->Evaluate(bandwidth_kb, latency_ms);
  response.accepted = decision.accepted;
  response.error = decision.reason.value_or("");
  if (!decision.accepted) {
    if (observability_) {
      observability_->IncrementQosRejection();
    }
    LogEvent(LogLevel::kDebug, "qos_rejected", trace_id, std::nullopt, room_id, response.error);
  }
  return response;
}

LookupRoomResponse BrokerService::LookupRoom(const std::string& room_id, Deadline deadline,
                                             const std::string& trace_id) const {
  LookupRoomResponse response;
  if (room_id.empty()) {
    response.error = kRoomIdRequired;
    return response;
  }
  auto outcome = registry_->LookupRoom(room_id, deadline);
  if (auto* failure = std::get_if<RegistryFailure>(&outcome)) {
    response.error = failure->message.empty() ? std::string{"저장소 오류"} : failure->message;
    LogEvent(LogLevel::kWarn, "lookup_room_failed", trace_id, std::nullopt, room_id, response.error);
    return response;
  }
  const auto& record = std::get<std::optional<RoomRecord>>(outcome);
  if (record) {
    response.found = true;
    response.room = *record;
  }
  return response;
}

void BrokerService::LogEvent(LogLevel level, const std::string& name, const std::string& trace_id,
                             std::optional<std::string> user_id, std::optional<std::string> room_id,
                             const std::string& message) const {
  if (!observability_) {
    return;
  }
  LogContext ctx;
  ctx.level = level;
  ctx.trace_id = trace_id;
  ctx.user_id = std::move(user_id);
  ctx.room_id = std::move(room_id);
  ctx.name = name;
  ctx.message = message;
  observability_->Log(ctx);
}

}  // namespace broker
