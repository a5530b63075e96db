/*
 * 설명: compact JWS(HS256) 토큰을 파싱해 서명을 검증하고 신원 클레임을 꺼낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_validator_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#include "broker/credential_validator.hpp"

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace broker {

namespace {
bool IsBase64UrlChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

bool Base64UrlDecode(const std::string& input, std::string& out) {
  if (input.empty() || input.size() % 4 == 1) {
    return false;
  }
  std::string b64;
  b64.reserve(input.size() + 3);
  for (char c : input) {
    if (!IsBase64UrlChar(c)) {
      return false;
    }
    b64.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
  }
  std::size_t padding = (4 - b64.size() % 4) % 4;
  b64.append(padding, '=');

  std::vector<unsigned char> buffer(b64.size() / 4 * 3);
  int len = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(b64.data()),
                            static_cast<int>(b64.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return false;
  }
  out.assign(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len) - padding);
  return true;
}

bool SplitCompact(const std::string& token, std::string& header, std::string& payload, std::string& signature) {
  auto first = token.find('.');
  if (first == std::string::npos) {
    return false;
  }
  auto second = token.find('.', first + 1);
  if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
    return false;
  }
  header = token.substr(0, first);
  payload = token.substr(first + 1, second - first - 1);
  signature = token.substr(second + 1);
  return !header.empty() && !payload.empty() && !signature.empty();
}

nlohmann::json ParseObject(const std::string& text) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return nlohmann::json{};
  }
  return parsed;
}
}  // namespace

CredentialValidator::CredentialValidator(const CredentialConfig& config) : config_(config) {}

AuthOutcome CredentialValidator::Validate(const std::string& credential) const {
  std::string header_b64;
  std::string payload_b64;
  std::string signature_b64;
  if (!SplitCompact(credential, header_b64, payload_b64, signature_b64)) {
    return AuthFailure{kInvalidToken};
  }

  std::string header_text;
  if (!Base64UrlDecode(header_b64, header_text)) {
    return AuthFailure{kInvalidToken};
  }
  auto header = ParseObject(header_text);
  // alg=none 등 다른 알고리즘은 허용하지 않는다.
  if (!header.contains("alg") || !header["alg"].is_string() || header["alg"].get<std::string>() != "HS256") {
    return AuthFailure{kInvalidToken};
  }

  std::string signature;
  if (!Base64UrlDecode(signature_b64, signature)) {
    return AuthFailure{kInvalidToken};
  }
  if (!VerifySignature(header_b64 + "." + payload_b64, signature)) {
    return AuthFailure{kInvalidToken};
  }

  std::string payload_text;
  if (!Base64UrlDecode(payload_b64, payload_text)) {
    return AuthFailure{kInvalidToken};
  }
  auto payload = ParseObject(payload_text);
  if (payload.is_null()) {
    return AuthFailure{kInvalidToken};
  }

  if (config_.enforce_expiry && payload.contains("exp")) {
    const auto& exp = payload["exp"];
    if (!exp.is_number_integer()) {
      return AuthFailure{kInvalidToken};
    }
    // time_point으로 바꾸면 먼 미래 값에서 오버플로가 나므로 초 단위 정수로 비교한다.
    const std::int64_t now_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(Now().time_since_epoch()).count();
    const bool expired = exp.is_number_unsigned()
                             ? now_seconds >= 0 && static_cast<std::uint64_t>(now_seconds) >= exp.get<std::uint64_t>()
                             : now_seconds >= exp.get<std::int64_t>();
    if (expired) {
      return AuthFailure{kTokenExpired};
    }
  }

  if (!payload.contains("userId") || !payload["userId"].is_string()) {
    return AuthFailure{kMissingIdentityClaim};
  }
  auto user_id = payload["userId"].get<std::string>();
  if (user_id.empty()) {
    return AuthFailure{kMissingIdentityClaim};
  }
  return Identity{user_id};
}

bool CredentialValidator::VerifySignature(const std::string& signing_input, const std::string& signature) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), config_.secret.data(), static_cast<int>(config_.secret.size()),
            reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest,
            &digest_len)) {
    return false;
  }
  if (signature.size() != digest_len) {
    return false;
  }
  return CRYPTO_memcmp(digest, signature.data(), digest_len) == 0;
}

}  // namespace broker
