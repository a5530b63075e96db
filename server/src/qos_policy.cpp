/*
 * 설명: QoS 제안의 승인 여부를 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/qos_policy_test.cpp
 */
#include "broker/qos_policy.hpp"

namespace broker {

QosDecision QosPolicyEngine::Evaluate(std::int32_t bandwidth_kb, std::int32_t latency_ms) const {
  // 두 경계 모두 승인 쪽에 포함된다. 어느 조건이 실패했는지는 구분하지 않는다.
  if (latency_ms <= thresholds_.max_latency_ms && bandwidth_kb >= thresholds_.min_bandwidth_kb) {
    return QosDecision{true, std::nullopt};
  }
  return QosDecision{false, std::string{kQosOutOfPolicy}};
}

}  // namespace broker
