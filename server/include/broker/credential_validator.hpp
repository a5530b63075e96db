/*
 * 설명: HS256 베어러 토큰 서명을 검증하고 userId 클레임을 추출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_validator_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <variant>

namespace broker {

inline constexpr const char* kInvalidToken = "invalid token";
inline constexpr const char* kMissingIdentityClaim = "missing identity claim";
inline constexpr const char* kTokenExpired = "token expired";

struct Identity {
  std::string user_id;
};

struct AuthFailure {
  std::string reason;
};

using AuthOutcome = std::variant<Identity, AuthFailure>;

struct CredentialConfig {
  std::string secret;
  // exp 클레임 검사는 기본적으로 꺼져 있다. 켜면 exp가 있는 토큰만 만료를 검사한다.
  bool enforce_expiry{false};
};

class CredentialValidator {
 public:
  explicit CredentialValidator(const CredentialConfig& config);
  virtual ~CredentialValidator() = default;

  virtual AuthOutcome Validate(const std::string& credential) const;

 protected:
  virtual std::chrono::system_clock::time_point Now() const { return std::chrono::system_clock::now(); }

 private:
  bool VerifySignature(const std::string& signing_input, const std::string& signature) const;

  CredentialConfig config_;
};

}  // namespace broker
