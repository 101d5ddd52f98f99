/*
 * 설명: /getToken 발급 흐름, 페이지 게이트, 헬스/메트릭 엔드포인트, CORS 헤더를 처리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_handler_test.cpp, server/tests/e2e/token_flow_test.cpp
 */
#include "roomkey/token_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <unordered_map>

#include <boost/algorithm/string/trim.hpp>

namespace roomkey {

namespace http = boost::beast::http;

namespace {
struct RouteEntry {
  const char* path;
  http::verb method;
};

constexpr RouteEntry kRoutes[] = {
    {kTokenRoute, http::verb::get},
    {"/health", http::verb::get},
    {"/metrics", http::verb::get},
    {"/", http::verb::get},
    {kCheckAuthRoute, http::verb::get},
    {kVerifyPasswordRoute, http::verb::post},
};

const RouteEntry* FindRoute(const std::string& path) {
  for (const auto& route : kRoutes) {
    if (path == route.path) {
      return &route;
    }
  }
  return nullptr;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string UrlDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      out.push_back(' ');
    } else if (value[i] == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 &&
               HexValue(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

bool AcceptsPlainText(const HttpRequest& req) {
  auto it = req.find(http::field::accept);
  if (it == req.end()) {
    return false;
  }
  auto value = std::string(it->value());
  return value.find("text/plain") != std::string::npos && value.find("application/json") == std::string::npos;
}

// Authorization: Bearer 헤더가 우선이고, 없으면 게이트 쿠키를 찾는다.
std::string GateTokenFrom(const HttpRequest& req) {
  auto auth = req.find(http::field::authorization);
  if (auth != req.end()) {
    std::string value(auth->value());
    const std::string prefix = "Bearer ";
    if (value.rfind(prefix, 0) == 0) {
      return value.substr(prefix.size());
    }
  }
  auto cookie = req.find(http::field::cookie);
  if (cookie == req.end()) {
    return {};
  }
  std::string header(cookie->value());
  const std::string key = std::string(kGateCookieName) + "=";
  std::size_t pos = 0;
  while (pos < header.size()) {
    auto semi = header.find(';', pos);
    std::string pair = header.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos);
    boost::algorithm::trim(pair);
    if (pair.rfind(key, 0) == 0) {
      return pair.substr(key.size());
    }
    if (semi == std::string::npos) {
      break;
    }
    pos = semi + 1;
  }
  return {};
}

std::string MakeSessionCookie(const GateSession& session, std::chrono::seconds ttl) {
  std::ostringstream oss;
  oss << kGateCookieName << "=" << session.token << "; Path=/; Max-Age=" << ttl.count() << "; HttpOnly; SameSite=Lax";
  return oss.str();
}

void WriteJson(HttpResponse& res, http::status status, const nlohmann::json& payload) {
  res.result(status);
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = SerializeJson(payload);
  res.content_length(res.body().size());
}

void WriteText(HttpResponse& res, http::status status, std::string body) {
  res.result(status);
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.body() = std::move(body);
  res.content_length(res.body().size());
}
}  // namespace

CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins) : allowed_origins_(std::move(allowed_origins)) {
  wildcard_ = std::find(allowed_origins_.begin(), allowed_origins_.end(), "*") != allowed_origins_.end();
}

std::optional<std::string> CorsPolicy::AllowOriginFor(std::string_view origin) const {
  if (origin.empty()) {
    return std::nullopt;
  }
  if (wildcard_) {
    return std::string("*");
  }
  for (const auto& allowed : allowed_origins_) {
    if (allowed.size() == origin.size() &&
        std::equal(allowed.begin(), allowed.end(), origin.begin(), [](char a, char b) {
          return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        })) {
      return std::string(origin);
    }
  }
  return std::nullopt;
}

TokenService::TokenService(const AppConfig& config, std::shared_ptr<const CredentialIssuer> issuer,
                           std::shared_ptr<Observability> observability, RoomNameGenerator room_namer)
    : livekit_url_(config.livekit_url), cors_(config.cors_allowed_origins), issuer_(std::move(issuer)),
      observability_(std::move(observability)), room_namer_(std::move(room_namer)) {
  PageGateConfig gate_config;
  gate_config.passwords = config.page_passwords;
  gate_config.session_ttl = std::chrono::seconds(config.page_session_ttl_seconds);
  gate_config.bypass = config.app_env == "development";
  gate_ = std::make_shared<PageGate>(std::move(gate_config));
}

HttpResponse TokenService::Handle(const HttpRequest& req) const {
  HttpResponse res{http::status::ok, req.version()};
  res.set(http::field::server, kServiceName);
  res.keep_alive(false);
  ApplyCors(req, res);

  std::string target_str = std::string(req.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (req.method() == http::verb::options) {
    res.result(http::status::no_content);
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
    res.set(http::field::access_control_max_age, "600");
    res.content_length(0);
    return res;
  }

  const RouteEntry* route = FindRoute(path);
  if (route == nullptr) {
    WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
    return res;
  }
  if (req.method() != route->method) {
    std::string allow = std::string(http::to_string(route->method)) + ", OPTIONS";
    res.set(http::field::allow, allow);
    WriteJson(res, http::status::method_not_allowed,
              MakeErrorEnvelope("method_not_allowed", "허용되지 않는 메서드입니다", {{"allow", allow}}));
    return res;
  }

  if (path == kTokenRoute) {
    HandleGetToken(req, query, res);
  } else if (path == "/health") {
    HandleHealth(res);
  } else if (path == "/metrics") {
    HandleMetrics(res);
  } else if (path == kCheckAuthRoute) {
    HandleCheckAuth(req, res);
  } else if (path == kVerifyPasswordRoute) {
    HandleVerifyPassword(req, res);
  } else {
    WriteText(res, http::status::ok, "roomkey token service is running");
  }
  return res;
}

void TokenService::HandleGetToken(const HttpRequest& req, const std::string& query, HttpResponse& res) const {
  auto params = ParseQueryParams(query);
  auto identity_it = params.find("identity");
  auto name_it = params.find("name");
  std::string identity = identity_it == params.end() ? std::string{} : identity_it->second;
  std::string name = name_it == params.end() ? std::string{} : name_it->second;

  try {
    auto room = room_namer_();
    auto credential = issuer_->Issue(identity, name, room);
    if (observability_) {
      observability_->IncrementIssued();
      observability_->Event(LogLevel::kDebug, "token", "credential_issued",
                            {{"room", credential.grant.room}, {"identity", credential.identity}});
    }
    if (AcceptsPlainText(req)) {
      WriteText(res, http::status::ok, credential.token);
      return;
    }
    nlohmann::json data{{"identity", credential.identity},
                        {"name", credential.name},
                        {"accessToken", credential.token},
                        {"roomName", credential.grant.room},
                        {"expiresAt", FormatIsoTimestamp(credential.expires_at)},
                        {"serverUrl", livekit_url_}};
    WriteJson(res, http::status::ok, data);
  } catch (const TokenError& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "token", "issue_failed",
                            {{"code", ToErrorCode(ex.code)}, {"message", ex.what()}});
    }
    WriteJson(res, http::status::internal_server_error, MakeErrorEnvelope(ToErrorCode(ex.code), ex.what()));
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "token", "issue_failed",
                            {{"code", "internal_error"}, {"message", ex.what()}});
    }
    WriteJson(res, http::status::internal_server_error,
              MakeErrorEnvelope("internal_error", "토큰 발급 중 오류가 발생했습니다"));
  }
}

void TokenService::HandleHealth(HttpResponse& res) const {
  nlohmann::json payload{{"status", "ok"}, {"service", kServiceName}, {"version", kServiceVersion}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
}

void TokenService::HandleMetrics(HttpResponse& res) const {
  MetricsSnapshot snapshot;
  if (observability_) {
    snapshot = observability_->Snapshot();
  }
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"tokens", {{"issued", snapshot.tokens_issued}}}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void TokenService::HandleCheckAuth(const HttpRequest& req, HttpResponse& res) const {
  bool authenticated = gate_->IsAuthenticated(GateTokenFrom(req), std::chrono::system_clock::now());
  WriteJson(res, authenticated ? http::status::ok : http::status::unauthorized, {{"authenticated", authenticated}});
}

void TokenService::HandleVerifyPassword(const HttpRequest& req, HttpResponse& res) const {
  std::string password;
  if (!gate_->BypassEnabled()) {
    auto body = nlohmann::json::parse(req.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("password") || !body["password"].is_string()) {
      WriteJson(res, http::status::bad_request, MakeErrorEnvelope("password_required", "password 필드가 필요합니다"));
      return;
    }
    password = body["password"].get<std::string>();
  }

  try {
    auto now = std::chrono::system_clock::now();
    auto session = gate_->VerifyPassword(password, now);
    if (!session) {
      if (observability_) {
        observability_->Event(LogLevel::kWarn, "gate", "password_rejected");
      }
      WriteJson(res, http::status::unauthorized, MakeErrorEnvelope("invalid_password", "비밀번호가 올바르지 않습니다"));
      return;
    }
    if (observability_) {
      observability_->Event(LogLevel::kInfo, "gate", "session_opened", {{"bypass", gate_->BypassEnabled()}});
    }
    res.set(http::field::set_cookie, MakeSessionCookie(*session, gate_->SessionTtl()));
    WriteJson(res, http::status::ok,
              MakeSuccessEnvelope({{"authenticated", true},
                                   {"sessionToken", session->token},
                                   {"expiresAt", FormatIsoTimestamp(session->expires_at)}}));
  } catch (const TokenError& ex) {
    WriteJson(res, http::status::internal_server_error, MakeErrorEnvelope(ToErrorCode(ex.code), ex.what()));
  }
}

void TokenService::ApplyCors(const HttpRequest& req, HttpResponse& res) const {
  auto origin_it = req.find(http::field::origin);
  if (origin_it == req.end()) {
    return;
  }
  auto allow = cors_.AllowOriginFor(std::string_view(origin_it->value().data(), origin_it->value().size()));
  if (!allow) {
    return;
  }
  res.set(http::field::access_control_allow_origin, *allow);
  if (*allow != "*") {
    // 게이트 쿠키를 교차 origin 요청에서도 주고받을 수 있게 한다.
    res.set(http::field::access_control_allow_credentials, "true");
    res.set(http::field::vary, "Origin");
  }
}

}  // namespace roomkey
