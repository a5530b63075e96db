/*
 * 설명: JSON 응답 엔벨로프를 생성하고 브로커 응답을 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "broker/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace broker {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const AuthenticateResponse& response) {
  return nlohmann::json{{"valid", response.valid}, {"userId", response.user_id}, {"error", response.error}};
}

nlohmann::json ToJson(const CreateRoomResponse& response) {
  return nlohmann::json{{"roomId", response.room_id}, {"error", response.error}};
}

nlohmann::json ToJson(const SelectQosResponse& response) {
  return nlohmann::json{{"accepted", response.accepted}, {"error", response.error}};
}

nlohmann::json ToJson(const LookupRoomResponse& response) {
  nlohmann::json data{{"found", response.found}, {"error", response.error}};
  if (response.found) {
    data["room"] = {{"id", response.room.id}, {"name", response.room.name}, {"ownerId", response.room.owner_id}};
  } else {
    data["room"] = nullptr;
  }
  return data;
}

}  // namespace broker
