/*
 * 설명: 환경변수에서 브로커 설정을 읽고 필수 항목을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "broker/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace broker {

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::string RequireEnv(const char* key) {
  const char* val = std::getenv(key);
  if (!val || std::string{val}.empty()) {
    throw ConfigError(std::string{key} + " 환경변수가 필요합니다");
  }
  return std::string{val};
}

unsigned long ParseUnsigned(const char* key, const std::string& value, unsigned long max) {
  // stoul은 부호와 공백을 허용하므로 숫자만으로 이루어졌는지 먼저 확인한다.
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError(std::string{key} + " 값이 올바르지 않습니다: " + value);
  }
  try {
    auto parsed = std::stoul(value);
    if (parsed > max) {
      throw ConfigError(std::string{key} + " 값이 허용 범위를 벗어났습니다: " + value);
    }
    return parsed;
  } catch (const std::out_of_range&) {
    throw ConfigError(std::string{key} + " 값이 허용 범위를 벗어났습니다: " + value);
  }
}

bool ParseBool(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered == "1" || lowered == "true" || lowered == "yes";
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  constexpr unsigned long kMaxPort = std::numeric_limits<unsigned short>::max();

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(ParseUnsigned("SERVER_PORT", GetEnv("SERVER_PORT", "8080"), kMaxPort));
  cfg.secret = RequireEnv("BROKER_SECRET");
  cfg.store_host = RequireEnv("STORE_HOST");
  cfg.store_port = static_cast<unsigned short>(ParseUnsigned("STORE_PORT", GetEnv("STORE_PORT", "3306"), kMaxPort));
  cfg.store_user = GetEnv("STORE_USER", "app");
  cfg.store_password = GetEnv("STORE_PASSWORD", "app_pass");
  cfg.store_name = GetEnv("STORE_NAME", "app_db");
  cfg.store_timeout_ms = static_cast<std::size_t>(
      ParseUnsigned("STORE_TIMEOUT_MS", GetEnv("STORE_TIMEOUT_MS", "2000"), kMaxStoreTimeoutMs));
  if (cfg.store_timeout_ms == 0) {
    throw ConfigError("STORE_TIMEOUT_MS는 0보다 커야 합니다");
  }
  cfg.auth_enforce_expiry = ParseBool(GetEnv("AUTH_ENFORCE_EXPIRY", "false"));
  cfg.instance_id = GetEnv("INSTANCE_ID", "");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  return cfg;
}

}  // namespace broker
