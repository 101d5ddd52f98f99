/*
 * 설명: 여러 유닛을 하나의 그룹으로 기동, 감시, 종료하고 최종 결과를 집계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/supervisor_test.cpp, server/tests/it/process_supervisor_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "roomkey/observability.hpp"
#include "roomkey/unit.hpp"

namespace roomkey {

enum class FailureReason {
  kNone,
  kUnexpectedExit,
  kLaunchFailed,
  kUncleanExit,
  kKilledAfterGrace,
};

const char* ToString(FailureReason reason);

struct SupervisionOutcome {
  bool success{true};
  std::string failed_unit;
  FailureReason reason{FailureReason::kNone};
  std::string detail;
};

struct SupervisorEvent {
  enum class Kind { kUnitExited, kLaunchFailed, kShutdownRequested, kAllSettled };
  Kind kind;
  std::string unit;
};

struct UnitStatus {
  std::string name;
  UnitState state;
  std::optional<UnitExit> last_exit;
};

struct SupervisorOptions {
  std::chrono::milliseconds grace_period{std::chrono::seconds(10)};
  // 프로세스의 SIGINT/SIGTERM을 종료 요청으로 받는다. 테스트에서는 끈다.
  bool handle_signals{true};
};

class Supervisor {
 public:
  Supervisor(boost::asio::io_context& ioc, std::vector<std::unique_ptr<Unit>> units, SupervisorOptions options,
             std::shared_ptr<Observability> observability);
  ~Supervisor();

  void Start();
  // 예기치 않은 종료, 기동 실패, 종료 요청 중 먼저 오는 것을 기다린다.
  SupervisorEvent AwaitAny();
  // 모든 실행 중 유닛에 SIGTERM을 보낸 뒤 유예 타이머를 건다. 만료 시 남은 유닛은 SIGKILL.
  void TerminateAll(std::chrono::milliseconds grace);
  // 모든 유닛이 종료 상태가 될 때까지 기다리고 결과를 돌려준다.
  SupervisionOutcome Join();
  // Start -> AwaitAny -> TerminateAll -> Join.
  SupervisionOutcome Run();

  // 어느 스레드에서나 호출할 수 있다. 종료 중에 다시 호출되면 남은 유닛을 즉시 강제 종료한다.
  void RequestShutdown();

  std::vector<UnitStatus> Statuses() const;

 private:
  struct UnitRecord {
    std::unique_ptr<Unit> unit;
    UnitState state{UnitState::kIdle};
    std::optional<UnitExit> last_exit;
    bool kill_sent{false};
  };

  void WaitForSignal();
  void OnShutdownRequested(const std::string& source);
  void OnUnitExit(std::size_t index, const UnitExit& exit);
  void OnGraceExpired();
  void KillRemaining(const std::string& detail);
  void Transition(UnitRecord& record, UnitState next);
  void RecordFailure(const std::string& unit, FailureReason reason, const std::string& detail);
  bool AllSettled() const;
  template <typename Predicate>
  void RunUntil(Predicate predicate);

  boost::asio::io_context& ioc_;
  std::vector<UnitRecord> records_;
  SupervisorOptions options_;
  std::shared_ptr<Observability> observability_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer grace_timer_;
  bool started_{false};
  bool shutdown_requested_{false};
  bool terminating_{false};
  bool unexpected_exit_{false};
  bool launch_failed_{false};
  SupervisionOutcome outcome_;
};

}  // namespace roomkey
