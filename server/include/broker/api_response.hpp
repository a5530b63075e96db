/*
 * 설명: REST 응답 엔벨로프와 브로커 응답 본문 직렬화를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "broker/broker_service.hpp"

namespace broker {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

nlohmann::json ToJson(const AuthenticateResponse& response);
nlohmann::json ToJson(const CreateRoomResponse& response);
nlohmann::json ToJson(const SelectQosResponse& response);
nlohmann::json ToJson(const LookupRoomResponse& response);

}  // namespace broker
