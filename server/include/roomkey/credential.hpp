/*
 * 설명: 방 참가 권한을 담은 단기 접근 토큰(HS256 JWT)을 발급하고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_issuer_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "roomkey/token_error.hpp"

namespace roomkey {

struct SigningKey {
  std::string api_key;
  std::string api_secret;
};

struct VideoGrant {
  bool room_join{true};
  std::string room;
};

struct AccessCredential {
  std::string identity;
  std::string name;
  VideoGrant grant;
  std::chrono::system_clock::time_point issued_at;
  std::chrono::system_clock::time_point expires_at;
  std::string token;
};

struct VerifiedClaims {
  std::string issuer;
  std::string identity;
  std::string name;
  VideoGrant grant;
  std::chrono::system_clock::time_point expires_at;
};

struct CredentialConfig {
  SigningKey key;
  std::chrono::seconds ttl{std::chrono::seconds(900)};
  std::string default_identity{"my_identity"};
};

nlohmann::json ToClaimsJson(const AccessCredential& credential, const std::string& issuer);

// 서명 키가 비었으면 kMissingSigningKey, room이 비었으면 kInvalidRoom. 실패 시 토큰은 만들지 않는다.
AccessCredential IssueCredential(const std::string& identity, const std::string& name, const std::string& room,
                                 const SigningKey& key, std::chrono::seconds ttl,
                                 std::chrono::system_clock::time_point now);

std::optional<VerifiedClaims> VerifyCredential(const std::string& token, const SigningKey& key,
                                               std::chrono::system_clock::time_point now);

class CredentialIssuer {
 public:
  explicit CredentialIssuer(const CredentialConfig& config);

  AccessCredential Issue(const std::string& identity, const std::string& room) const;
  AccessCredential Issue(const std::string& identity, const std::string& name, const std::string& room) const;
  std::optional<VerifiedClaims> Verify(const std::string& token) const;

  const CredentialConfig& GetConfig() const { return config_; }

 private:
  CredentialConfig config_;
};

}  // namespace roomkey
