/*
 * 설명: 대역폭/지연 임계값 기반 QoS 승인 정책.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/qos_policy_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace broker {

inline constexpr const char* kQosOutOfPolicy = "QoS parameters out of policy";

struct QosDecision {
  bool accepted{false};
  std::optional<std::string> reason;
};

struct QosThresholds {
  std::int32_t min_bandwidth_kb{1000};
  std::int32_t max_latency_ms{100};
};

class QosPolicyEngine {
 public:
  QosPolicyEngine() = default;
  explicit QosPolicyEngine(const QosThresholds& thresholds) : thresholds_(thresholds) {}
  virtual ~QosPolicyEngine() = default;

  virtual QosDecision Evaluate(std::int32_t bandwidth_kb, std::int32_t latency_ms) const;

 private:
  QosThresholds thresholds_;
};

}  // namespace broker
