/*
 * 설명: 토큰 서버와 슈퍼바이저의 환경설정 로딩, 기본값, 검증을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomkey {

class ConfigError : public std::runtime_error {
 public:
  ConfigError(const std::string& key, const std::string& message)
      : std::runtime_error(key + ": " + message), key(key) {}
  std::string key;
};

struct AppConfig {
  std::string address;
  unsigned short port;
  std::string livekit_api_key;
  std::string livekit_api_secret;
  std::string livekit_url;
  std::vector<std::string> cors_allowed_origins;
  std::size_t token_ttl_seconds;
  std::string default_identity;
  std::string log_level;
  // 페이지 접근 게이트. development 환경이면 비밀번호 없이 통과한다.
  std::vector<std::string> page_passwords;
  std::size_t page_session_ttl_seconds{1800};
  std::string app_env{"production"};
};

struct UnitCommand {
  std::string name;
  std::vector<std::string> argv;
};

struct SupervisorConfig {
  std::vector<UnitCommand> units;
  std::size_t grace_period_seconds;
  std::string log_level;
};

AppConfig LoadConfigFromEnv();
void ValidateConfig(const AppConfig& config);

SupervisorConfig LoadSupervisorConfigFromEnv();
void ValidateSupervisorConfig(const SupervisorConfig& config);

// 쉼표로 구분된 목록. 공백은 제거하고 빈 항목은 버린다.
std::vector<std::string> ParseCommaList(const std::string& value);
// POSIX 셸처럼 작은따옴표, 큰따옴표, 역슬래시를 해석해 명령줄을 argv로 나눈다.
// 변수 확장이나 글롭은 하지 않는다. 닫히지 않은 따옴표는 ConfigError.
std::vector<std::string> SplitCommandLine(const std::string& value);

}  // namespace roomkey
