/*
 * 설명: 토큰 서버 프로세스의 수명주기(리스닝, 워커 스레드, 종료 신호)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "roomkey/config.hpp"
#include "roomkey/credential.hpp"
#include "roomkey/observability.hpp"
#include "roomkey/token_service.hpp"

namespace roomkey {

class Listener;

class TokenServerApp {
 public:
  // 서명 키가 없으면 TokenError(kMissingSigningKey)를 던지며 요청을 받지 않는다.
  explicit TokenServerApp(const AppConfig& config, RoomNameGenerator room_namer = {});
  ~TokenServerApp();

  // 바인드 후 워커 스레드만 띄우고 반환한다.
  void Start(bool handle_signals = false);
  // Start 후 현재 스레드에서도 이벤트 루프를 돌린다. Stop 될 때까지 반환하지 않는다.
  void Run();
  void Stop();

  unsigned short LocalPort() const;
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<const CredentialIssuer> GetIssuer() const { return issuer_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers(unsigned int count);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<const CredentialIssuer> issuer_;
  std::shared_ptr<const TokenService> service_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace roomkey
