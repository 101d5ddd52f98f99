/*
 * 설명: 토큰 서버 진입점으로 환경설정을 검증한 뒤 HTTP 서비스를 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#include <iostream>

#include "roomkey/app.hpp"

int main() {
  using namespace roomkey;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
    ValidateConfig(config);
  } catch (const ConfigError& ex) {
    std::cerr << "설정 오류, 토큰 서버를 시작하지 않습니다: " << ex.what() << "\n";
    return 2;
  }

  try {
    TokenServerApp app(config);
    app.Run();
  } catch (const TokenError& ex) {
    std::cerr << "자격 증명 발급기를 초기화할 수 없습니다: " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
