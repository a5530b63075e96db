/*
 * 설명: 구조화 로그와 브로커 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace broker {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);
const char* LogLevelName(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> room_id;
  std::string name;
  long latency_ms{0};
  std::string message;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t rooms_created{0};
  std::uint64_t registry_failures{0};
  std::uint64_t auth_failures{0};
  std::uint64_t qos_rejections{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  // 테스트에서 로그 출력을 가로챌 때 사용한다.
  Observability(LogLevel min_level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementRoomsCreated();
  void IncrementRegistryFailure();
  void IncrementAuthFailure();
  void IncrementQosRejection();
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& out_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> rooms_created_{0};
  std::atomic<std::uint64_t> registry_failures_{0};
  std::atomic<std::uint64_t> auth_failures_{0};
  std::atomic<std::uint64_t> qos_rejections_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace broker
