/*
 * 설명: 환경 변수에서 설정을 읽고 기동 전에 검증한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "roomkey/config.hpp"

#include <cstdlib>
#include <cstring>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/ip/address.hpp>

namespace roomkey {

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t ParseUnsigned(const char* key, const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      throw ConfigError(key, "숫자가 아닌 문자가 포함되어 있습니다: " + value);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::invalid_argument&) {
    throw ConfigError(key, "숫자 형식이 아닙니다: " + value);
  } catch (const std::out_of_range&) {
    throw ConfigError(key, "값이 너무 큽니다: " + value);
  }
}

unsigned short ParsePort(const char* key, const std::string& value) {
  auto parsed = ParseUnsigned(key, value);
  if (parsed > 65535) {
    throw ConfigError(key, "포트 범위를 벗어났습니다: " + value);
  }
  return static_cast<unsigned short>(parsed);
}

bool IsValidOrigin(const std::string& origin) {
  if (origin == "*") {
    return true;
  }
  std::string rest;
  if (origin.rfind("http://", 0) == 0) {
    rest = origin.substr(7);
  } else if (origin.rfind("https://", 0) == 0) {
    rest = origin.substr(8);
  } else {
    return false;
  }
  if (rest.empty() || rest.find('/') != std::string::npos) {
    return false;
  }
  return rest.find_first_of(" \t?#") == std::string::npos;
}
}  // namespace

std::vector<std::string> ParseCommaList(const std::string& value) {
  std::vector<std::string> items;
  std::size_t pos = 0;
  while (pos <= value.size()) {
    auto comma = value.find(',', pos);
    std::string item = value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
    boost::algorithm::trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
    if (comma == std::string::npos) {
      break;
    }
    pos = comma + 1;
  }
  return items;
}

std::vector<std::string> SplitCommandLine(const std::string& value) {
  enum class Quote { kNone, kSingle, kDouble };
  std::vector<std::string> argv;
  std::string current;
  bool in_word = false;
  Quote quote = Quote::kNone;

  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (quote == Quote::kSingle) {
      if (c == '\'') {
        quote = Quote::kNone;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (quote == Quote::kDouble) {
      if (c == '"') {
        quote = Quote::kNone;
      } else if (c == '\\' && i + 1 < value.size() && std::strchr("\\\"$`", value[i + 1]) != nullptr) {
        current.push_back(value[++i]);
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\n') {
      if (in_word) {
        argv.push_back(current);
        current.clear();
        in_word = false;
      }
      continue;
    }
    in_word = true;
    if (c == '\'') {
      quote = Quote::kSingle;
    } else if (c == '"') {
      quote = Quote::kDouble;
    } else if (c == '\\') {
      if (i + 1 == value.size()) {
        throw ConfigError("command", "명령줄이 역슬래시로 끝납니다: " + value);
      }
      current.push_back(value[++i]);
    } else {
      current.push_back(c);
    }
  }
  if (quote != Quote::kNone) {
    throw ConfigError("command", "닫히지 않은 따옴표가 있습니다: " + value);
  }
  if (in_word) {
    argv.push_back(current);
  }
  return argv;
}

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.address = GetEnv("SERVER_ADDRESS", "0.0.0.0");
  cfg.port = ParsePort("SERVER_PORT", GetEnv("SERVER_PORT", "5001"));
  cfg.livekit_api_key = GetEnv("LIVEKIT_API_KEY", "");
  cfg.livekit_api_secret = GetEnv("LIVEKIT_API_SECRET", "");
  cfg.livekit_url = GetEnv("LIVEKIT_URL", "");
  cfg.cors_allowed_origins = ParseCommaList(GetEnv("CORS_ALLOWED_ORIGINS", "*"));
  cfg.token_ttl_seconds = ParseUnsigned("TOKEN_TTL_SECONDS", GetEnv("TOKEN_TTL_SECONDS", "900"));
  cfg.default_identity = GetEnv("DEFAULT_IDENTITY", "my_identity");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.page_passwords = ParseCommaList(GetEnv("PAGE_PASSWORDS", ""));
  cfg.page_session_ttl_seconds =
      ParseUnsigned("PAGE_SESSION_TTL_SECONDS", GetEnv("PAGE_SESSION_TTL_SECONDS", "1800"));
  cfg.app_env = boost::algorithm::to_lower_copy(GetEnv("APP_ENV", "production"));
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  boost::system::error_code ec;
  boost::asio::ip::make_address(config.address, ec);
  if (ec) {
    throw ConfigError("SERVER_ADDRESS", "IP 주소 형식이 아닙니다: " + config.address);
  }
  if (config.livekit_api_key.empty()) {
    throw ConfigError("LIVEKIT_API_KEY", "서명 키 식별자가 설정되지 않았습니다");
  }
  if (config.livekit_api_secret.empty()) {
    throw ConfigError("LIVEKIT_API_SECRET", "서명 비밀키가 설정되지 않았습니다");
  }
  if (config.cors_allowed_origins.empty()) {
    throw ConfigError("CORS_ALLOWED_ORIGINS", "허용 origin이 비어 있습니다");
  }
  for (const auto& origin : config.cors_allowed_origins) {
    if (!IsValidOrigin(origin)) {
      throw ConfigError("CORS_ALLOWED_ORIGINS", "origin 형식이 올바르지 않습니다: " + origin);
    }
  }
  if (config.token_ttl_seconds < 60 || config.token_ttl_seconds > 86400) {
    throw ConfigError("TOKEN_TTL_SECONDS", "60초 이상 86400초 이하여야 합니다");
  }
  if (config.default_identity.empty()) {
    throw ConfigError("DEFAULT_IDENTITY", "기본 identity가 비어 있습니다");
  }
  if (config.log_level != "debug" && config.log_level != "info" && config.log_level != "warn" &&
      config.log_level != "error") {
    throw ConfigError("LOG_LEVEL", "debug, info, warn, error 중 하나여야 합니다");
  }
  if (config.page_session_ttl_seconds < 60 || config.page_session_ttl_seconds > 86400) {
    throw ConfigError("PAGE_SESSION_TTL_SECONDS", "60초 이상 86400초 이하여야 합니다");
  }
  if (config.app_env.empty()) {
    throw ConfigError("APP_ENV", "실행 환경 이름이 비어 있습니다");
  }
}

SupervisorConfig LoadSupervisorConfigFromEnv() {
  SupervisorConfig cfg;
  cfg.units.push_back(UnitCommand{"session-handler", SplitCommandLine(GetEnv("SESSION_HANDLER_CMD", ""))});
  cfg.units.push_back(
      UnitCommand{"token-service", SplitCommandLine(GetEnv("TOKEN_SERVICE_CMD", "roomkey_token_server"))});
  auto summary = SplitCommandLine(GetEnv("SUMMARY_SERVICE_CMD", ""));
  if (!summary.empty()) {
    cfg.units.push_back(UnitCommand{"summary-service", summary});
  }
  cfg.grace_period_seconds = ParseUnsigned("SUPERVISOR_GRACE_SECONDS", GetEnv("SUPERVISOR_GRACE_SECONDS", "10"));
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  return cfg;
}

void ValidateSupervisorConfig(const SupervisorConfig& config) {
  if (config.units.empty()) {
    throw ConfigError("units", "감독할 유닛이 없습니다");
  }
  for (const auto& unit : config.units) {
    if (unit.argv.empty()) {
      if (unit.name == "session-handler") {
        throw ConfigError("SESSION_HANDLER_CMD", "세션 핸들러 실행 명령이 필요합니다");
      }
      throw ConfigError(unit.name, "실행 명령이 비어 있습니다");
    }
  }
  if (config.grace_period_seconds < 1 || config.grace_period_seconds > 300) {
    throw ConfigError("SUPERVISOR_GRACE_SECONDS", "1초 이상 300초 이하여야 합니다");
  }
}

}  // namespace roomkey
