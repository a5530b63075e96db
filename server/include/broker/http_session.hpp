/*
 * 설명: HTTP 연결을 처리하고 인증/방 생성/QoS 선택 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "broker/broker_service.hpp"
#include "broker/config.hpp"
#include "broker/observability.hpp"

namespace broker {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<BrokerService> broker_service, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleAuthenticate(std::shared_ptr<Response> res);
  void HandleCreateRoom(std::shared_ptr<Response> res);
  void HandleSelectQos(std::shared_ptr<Response> res);
  void HandleLookupRoom(std::shared_ptr<Response> res, const std::string& room_id);
  void WriteJson(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  std::optional<Deadline> RequestDeadline();
  std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<BrokerService> broker_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace broker
