/*
 * 설명: 토큰 발급과 페이지 게이트 HTTP 라우팅, CORS 정책, 오류 매핑을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_handler_test.cpp, server/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http.hpp>

#include "roomkey/api_response.hpp"
#include "roomkey/config.hpp"
#include "roomkey/credential.hpp"
#include "roomkey/observability.hpp"
#include "roomkey/page_gate.hpp"

namespace roomkey {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RoomNameGenerator = std::function<std::string()>;

constexpr const char* kTokenRoute = "/getToken";
constexpr const char* kCheckAuthRoute = "/check-auth";
constexpr const char* kVerifyPasswordRoute = "/verify-password";

class CorsPolicy {
 public:
  explicit CorsPolicy(std::vector<std::string> allowed_origins);

  // 허용된 origin이면 Access-Control-Allow-Origin 값을 돌려준다.
  std::optional<std::string> AllowOriginFor(std::string_view origin) const;
  bool IsWildcard() const { return wildcard_; }

 private:
  std::vector<std::string> allowed_origins_;
  bool wildcard_{false};
};

class TokenService {
 public:
  TokenService(const AppConfig& config, std::shared_ptr<const CredentialIssuer> issuer,
               std::shared_ptr<Observability> observability, RoomNameGenerator room_namer);

  HttpResponse Handle(const HttpRequest& req) const;

  std::shared_ptr<PageGate> GetGate() const { return gate_; }

 private:
  void HandleGetToken(const HttpRequest& req, const std::string& query, HttpResponse& res) const;
  void HandleHealth(HttpResponse& res) const;
  void HandleMetrics(HttpResponse& res) const;
  void HandleCheckAuth(const HttpRequest& req, HttpResponse& res) const;
  void HandleVerifyPassword(const HttpRequest& req, HttpResponse& res) const;
  void ApplyCors(const HttpRequest& req, HttpResponse& res) const;

  std::string livekit_url_;
  CorsPolicy cors_;
  std::shared_ptr<PageGate> gate_;
  std::shared_ptr<const CredentialIssuer> issuer_;
  std::shared_ptr<Observability> observability_;
  RoomNameGenerator room_namer_;
};

}  // namespace roomkey
