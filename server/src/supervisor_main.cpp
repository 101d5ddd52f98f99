/*
 * 설명: 세션 핸들러와 토큰 서버를 한 그룹으로 띄우는 슈퍼바이저 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/process_supervisor_it_test.cpp
 */
#include <iostream>

#include <boost/asio/io_context.hpp>

#include "roomkey/config.hpp"
#include "roomkey/observability.hpp"
#include "roomkey/process_unit.hpp"
#include "roomkey/supervisor.hpp"

int main() {
  using namespace roomkey;
  SupervisorConfig config;
  try {
    config = LoadSupervisorConfigFromEnv();
    ValidateSupervisorConfig(config);
  } catch (const ConfigError& ex) {
    std::cerr << "설정 오류, 슈퍼바이저를 시작하지 않습니다: " << ex.what() << "\n";
    return 2;
  }

  auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  boost::asio::io_context ioc(1);
  std::vector<std::unique_ptr<Unit>> units;
  for (const auto& command : config.units) {
    units.push_back(std::make_unique<ProcessUnit>(ioc, command, observability));
  }

  SupervisorOptions options;
  options.grace_period = std::chrono::seconds(config.grace_period_seconds);
  options.handle_signals = true;

  Supervisor supervisor(ioc, std::move(units), options, observability);
  auto outcome = supervisor.Run();
  if (!outcome.success) {
    std::cerr << "유닛 그룹 비정상 종료: " << outcome.failed_unit << " (" << ToString(outcome.reason) << ", "
              << outcome.detail << ")\n";
    return 1;
  }
  return 0;
}
