/*
 * 설명: LiveKit 호환 접근 토큰의 클레임 구성, HS256 서명, 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_issuer_test.cpp
 */
#include "roomkey/credential.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "roomkey/api_response.hpp"

namespace roomkey {

namespace {
constexpr const char* kJwtHeader = R"({"alg":"HS256","typ":"JWT"})";

std::vector<unsigned char> ToBytes(const std::string& input) {
  return std::vector<unsigned char>(input.begin(), input.end());
}

std::string Base64UrlEncode(const std::string& input) {
  auto bytes = ToBytes(input);
  std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), bytes.data(), static_cast<int>(bytes.size()));
  std::string encoded(out.begin(), out.begin() + len);
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(std::string input) {
  for (auto& c : input) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    }
  }
  std::size_t padding = (4 - input.size() % 4) % 4;
  if (padding == 3) {
    return std::nullopt;
  }
  input.append(padding, '=');
  auto bytes = ToBytes(input);
  std::vector<unsigned char> out(bytes.size() / 4 * 3 + 1);
  int len = EVP_DecodeBlock(out.data(), bytes.data(), static_cast<int>(bytes.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 자리까지 0으로 채워 길이에 포함한다.
  return std::string(out.begin(), out.begin() + (len - static_cast<int>(padding)));
}

std::string HmacSha256(const std::string& secret, const std::string& data) {
  auto bytes = ToBytes(data);
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()), bytes.data(), bytes.size(),
            digest.data(), &digest_len)) {
    throw std::runtime_error("HMAC-SHA256 계산에 실패했습니다");
  }
  return std::string(digest.begin(), digest.begin() + digest_len);
}

std::int64_t ToEpochSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

void RequireSigningKey(const SigningKey& key) {
  if (key.api_key.empty() || key.api_secret.empty()) {
    throw TokenError(TokenErrorCode::kMissingSigningKey, "서명 키가 설정되지 않았습니다");
  }
}
}  // namespace

const char* ToErrorCode(TokenErrorCode code) {
  switch (code) {
    case TokenErrorCode::kRandomnessUnavailable:
      return "randomness_unavailable";
    case TokenErrorCode::kMissingSigningKey:
      return "missing_signing_key";
    case TokenErrorCode::kInvalidRoom:
      return "invalid_room";
  }
  return "internal_error";
}

nlohmann::json ToClaimsJson(const AccessCredential& credential, const std::string& issuer) {
  nlohmann::json claims;
  claims["iss"] = issuer;
  claims["sub"] = credential.identity;
  claims["name"] = credential.name;
  claims["jti"] = credential.identity;
  claims["iat"] = ToEpochSeconds(credential.issued_at);
  claims["nbf"] = ToEpochSeconds(credential.issued_at);
  claims["exp"] = ToEpochSeconds(credential.expires_at);
  claims["video"] = {{"roomJoin", credential.grant.room_join}, {"room", credential.grant.room}};
  return claims;
}

AccessCredential IssueCredential(const std::string& identity, const std::string& name, const std::string& room,
                                 const SigningKey& key, std::chrono::seconds ttl,
                                 std::chrono::system_clock::time_point now) {
  RequireSigningKey(key);
  if (room.empty()) {
    throw TokenError(TokenErrorCode::kInvalidRoom, "room 값이 비어 있습니다");
  }
  AccessCredential credential;
  credential.identity = identity;
  credential.name = name.empty() ? identity : name;
  credential.grant = VideoGrant{true, room};
  credential.issued_at = now;
  credential.expires_at = now + ttl;

  auto claims = SerializeJson(ToClaimsJson(credential, key.api_key));
  auto signing_input = Base64UrlEncode(kJwtHeader) + "." + Base64UrlEncode(claims);
  credential.token = signing_input + "." + Base64UrlEncode(HmacSha256(key.api_secret, signing_input));
  return credential;
}

std::optional<VerifiedClaims> VerifyCredential(const std::string& token, const SigningKey& key,
                                               std::chrono::system_clock::time_point now) {
  if (key.api_secret.empty()) {
    return std::nullopt;
  }
  auto first = token.find('.');
  auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
    return std::nullopt;
  }
  auto header = Base64UrlDecode(token.substr(0, first));
  auto payload = Base64UrlDecode(token.substr(first + 1, second - first - 1));
  auto signature = Base64UrlDecode(token.substr(second + 1));
  if (!header || !payload || !signature) {
    return std::nullopt;
  }

  auto expected = HmacSha256(key.api_secret, token.substr(0, second));
  if (expected.size() != signature->size() ||
      CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
    return std::nullopt;
  }

  try {
    auto header_json = nlohmann::json::parse(*header);
    if (header_json.value("alg", "") != "HS256") {
      return std::nullopt;
    }
    auto claims = nlohmann::json::parse(*payload);
    auto exp = claims.at("exp").get<std::int64_t>();
    if (ToEpochSeconds(now) >= exp) {
      return std::nullopt;
    }
    VerifiedClaims verified;
    verified.issuer = claims.at("iss").get<std::string>();
    verified.identity = claims.at("sub").get<std::string>();
    verified.name = claims.value("name", "");
    verified.grant.room_join = claims.at("video").at("roomJoin").get<bool>();
    verified.grant.room = claims.at("video").at("room").get<std::string>();
    verified.expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(exp));
    return verified;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

CredentialIssuer::CredentialIssuer(const CredentialConfig& config) : config_(config) {
  RequireSigningKey(config_.key);
}

AccessCredential CredentialIssuer::Issue(const std::string& identity, const std::string& room) const {
  return Issue(identity, std::string{}, room);
}

AccessCredential CredentialIssuer::Issue(const std::string& identity, const std::string& name,
                                         const std::string& room) const {
  const std::string& effective = identity.empty() ? config_.default_identity : identity;
  return IssueCredential(effective, name, room, config_.key, config_.ttl, std::chrono::system_clock::now());
}

std::optional<VerifiedClaims> CredentialIssuer::Verify(const std::string& token) const {
  return VerifyCredential(token, config_.key, std::chrono::system_clock::now());
}

}  // namespace roomkey
