/*
 * 설명: HTTP 요청을 브로커 연산으로 분기하고 JSON 엔벨로프로 응답한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "broker/http_session.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <boost/beast/version.hpp>

#include "broker/api_response.hpp"

namespace broker {

namespace {
const std::string kRoomsPrefix = "/api/rooms/";

class BadRequest : public std::runtime_error {
 public:
  explicit BadRequest(const std::string& message) : std::runtime_error(message) {}
};

nlohmann::json ParseBody(const std::string& body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw BadRequest("JSON 본문이 올바르지 않습니다");
  }
  return parsed;
}

// 누락된 필드는 빈 값으로 본다. 타입이 다르면 요청 자체가 잘못된 것이다.
std::string StringField(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return {};
  }
  if (!body[key].is_string()) {
    throw BadRequest(std::string{key} + " 필드는 문자열이어야 합니다");
  }
  return body[key].get<std::string>();
}

std::int32_t Int32Field(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return 0;
  }
  const auto& value = body[key];
  if (value.is_number_unsigned()) {
    auto parsed = value.get<std::uint64_t>();
    if (parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
      throw BadRequest(std::string{key} + " 값이 int32 범위를 벗어났습니다");
    }
    return static_cast<std::int32_t>(parsed);
  }
  if (value.is_number_integer()) {
    auto parsed = value.get<std::int64_t>();
    if (parsed < std::numeric_limits<std::int32_t>::min() || parsed > std::numeric_limits<std::int32_t>::max()) {
      throw BadRequest(std::string{key} + " 값이 int32 범위를 벗어났습니다");
    }
    return static_cast<std::int32_t>(parsed);
  }
  throw BadRequest(std::string{key} + " 필드는 정수여야 합니다");
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    auto parsed = std::stoul(value);
    if (parsed == 0) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<BrokerService> broker_service, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), broker_service_(std::move(broker_service)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "room-broker");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"rooms", {{"created", snapshot.rooms_created}, {"failures", snapshot.registry_failures}}},
                        {"auth", {{"failures", snapshot.auth_failures}}},
                        {"qos", {{"rejections", snapshot.qos_rejections}}}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  try {
    if (req_.method() == http::verb::post && path == "/api/auth/authenticate") {
      return HandleAuthenticate(res);
    }
    if (req_.method() == http::verb::post && path == "/api/rooms") {
      return HandleCreateRoom(res);
    }
    if (req_.method() == http::verb::post && path == "/api/qos/select") {
      return HandleSelectQos(res);
    }
    if (req_.method() == http::verb::get && path.compare(0, kRoomsPrefix.size(), kRoomsPrefix) == 0) {
      return HandleLookupRoom(res, path.substr(kRoomsPrefix.size()));
    }
  } catch (const BadRequest& ex) {
    return WriteJson(res, http::status::bad_request, MakeErrorEnvelope("bad_request", ex.what()));
  }

  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleAuthenticate(std::shared_ptr<Response> res) {
  std::string token;
  if (!req_.body().empty()) {
    token = StringField(ParseBody(req_.body()), "token");
  }
  if (token.empty()) {
    auto auth_it = req_.find(boost::beast::http::field::authorization);
    if (auth_it != req_.end()) {
      token = ParseBearer(std::string(auth_it->value()));
    }
  }
  auto response = broker_service_->Authenticate(token, trace_id_);
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(response)));
}

void HttpSession::HandleCreateRoom(std::shared_ptr<Response> res) {
  auto body = ParseBody(req_.body());
  auto user_id = StringField(body, "userId");
  auto room_name = StringField(body, "roomName");
  auto deadline = RequestDeadline();
  if (!deadline) {
    throw BadRequest("X-Request-Timeout-Ms 값이 올바르지 않습니다");
  }
  auto response = broker_service_->CreateRoom(user_id, room_name, *deadline, trace_id_);
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(response)));
}

void HttpSession::HandleSelectQos(std::shared_ptr<Response> res) {
  auto body = ParseBody(req_.body());
  auto room_id = StringField(body, "roomId");
  auto bandwidth_kb = Int32Field(body, "bandwidthKb");
  auto latency_ms = Int32Field(body, "latencyMs");
  auto response = broker_service_->SelectQos(room_id, bandwidth_kb, latency_ms, trace_id_);
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(response)));
}

void HttpSession::HandleLookupRoom(std::shared_ptr<Response> res, const std::string& room_id) {
  auto deadline = RequestDeadline();
  if (!deadline) {
    throw BadRequest("X-Request-Timeout-Ms 값이 올바르지 않습니다");
  }
  auto response = broker_service_->LookupRoom(room_id, *deadline, trace_id_);
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(response)));
}

void HttpSession::WriteJson(std::shared_ptr<Response> res, boost::beast::http::status status,
                            const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

std::optional<Deadline> HttpSession::RequestDeadline() {
  auto timeout_ms = config_.store_timeout_ms;
  auto header_it = req_.base().find("X-Request-Timeout-Ms");
  if (header_it != req_.base().end()) {
    auto parsed = ParsePositiveInt(std::string(header_it->value()));
    if (!parsed) {
      return std::nullopt;
    }
    timeout_ms = std::min(*parsed, kMaxStoreTimeoutMs);
  }
  return request_start_ + std::chrono::milliseconds(timeout_ms);
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace broker
