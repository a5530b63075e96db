/*
 * 설명: 브로커 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace broker {

// 저장소 기한의 상한. STORE_TIMEOUT_MS와 X-Request-Timeout-Ms 모두에 적용된다.
constexpr std::size_t kMaxStoreTimeoutMs = 600000;

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct AppConfig {
  unsigned short port;
  std::string secret;
  std::string store_host;
  unsigned short store_port;
  std::string store_user;
  std::string store_password;
  std::string store_name;
  std::size_t store_timeout_ms;
  bool auth_enforce_expiry;
  std::string instance_id;
  std::string log_level;
};

// 필수 항목(BROKER_SECRET, STORE_HOST)이 없거나 숫자 파싱에 실패하면 ConfigError를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace broker
