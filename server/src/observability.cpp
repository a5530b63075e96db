/*
 * 설명: 구조화 로그와 브로커 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "broker/observability.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace broker {

namespace {
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : Observability(min_level, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementRoomsCreated() { rooms_created_.fetch_add(1); }

void Observability::IncrementRegistryFailure() { registry_failures_.fetch_add(1); }

void Observability::IncrementAuthFailure() { auth_failures_.fetch_add(1); }

void Observability::IncrementQosRejection() { qos_rejections_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.rooms_created = rooms_created_.load();
  snapshot.registry_failures = registry_failures_.load();
  snapshot.auth_failures = auth_failures_.load();
  snapshot.qos_rejections = qos_rejections_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (static_cast<int>(ctx.level) < static_cast<int>(min_level_)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  std::lock_guard<std::mutex> lock(LogMutex());
  out_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace broker
