/*
 * 설명: 유닛 그룹의 기동, fail-fast 감시, 유예 후 강제 종료, 결과 집계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/supervisor_test.cpp, server/tests/it/process_supervisor_it_test.cpp
 */
#include "roomkey/supervisor.hpp"

#include <csignal>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

namespace roomkey {

const char* ToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::kNone:
      return "none";
    case FailureReason::kUnexpectedExit:
      return "unexpected_exit";
    case FailureReason::kLaunchFailed:
      return "launch_failed";
    case FailureReason::kUncleanExit:
      return "unclean_exit";
    case FailureReason::kKilledAfterGrace:
      return "killed_after_grace";
  }
  return "unknown";
}

template <typename Predicate>
void Supervisor::RunUntil(Predicate predicate) {
  auto guard = boost::asio::make_work_guard(ioc_);
  while (!predicate()) {
    if (ioc_.stopped()) {
      ioc_.restart();
    }
    ioc_.run_one();
  }
}

Supervisor::Supervisor(boost::asio::io_context& ioc, std::vector<std::unique_ptr<Unit>> units,
                       SupervisorOptions options, std::shared_ptr<Observability> observability)
    : ioc_(ioc), options_(options),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      signals_(ioc), grace_timer_(ioc) {
  records_.reserve(units.size());
  for (auto& unit : units) {
    UnitRecord record;
    record.unit = std::move(unit);
    records_.push_back(std::move(record));
  }
}

Supervisor::~Supervisor() {
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  grace_timer_.cancel();
}

void Supervisor::Start() {
  if (started_) {
    return;
  }
  started_ = true;
  if (options_.handle_signals) {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    WaitForSignal();
  }

  for (std::size_t i = 0; i < records_.size(); ++i) {
    auto& record = records_[i];
    const std::string name = record.unit->Name();
    Transition(record, UnitState::kStarting);
    try {
      record.unit->Launch([this, i](const UnitExit& exit) { OnUnitExit(i, exit); });
    } catch (const std::exception& ex) {
      Transition(record, UnitState::kCrashed);
      launch_failed_ = true;
      RecordFailure(name, FailureReason::kLaunchFailed, ex.what());
      // 나머지 유닛은 띄우지 않고 이미 떠 있는 유닛만 정리한다.
      break;
    }
    Transition(record, UnitState::kRunning);
    observability_->Event(LogLevel::kInfo, "supervisor", "unit_running", {{"unit", name}});
  }
}

SupervisorEvent Supervisor::AwaitAny() {
  RunUntil([this]() { return shutdown_requested_ || unexpected_exit_ || launch_failed_ || AllSettled(); });
  if (launch_failed_) {
    return SupervisorEvent{SupervisorEvent::Kind::kLaunchFailed, outcome_.failed_unit};
  }
  if (unexpected_exit_) {
    return SupervisorEvent{SupervisorEvent::Kind::kUnitExited, outcome_.failed_unit};
  }
  if (shutdown_requested_) {
    return SupervisorEvent{SupervisorEvent::Kind::kShutdownRequested, {}};
  }
  return SupervisorEvent{SupervisorEvent::Kind::kAllSettled, {}};
}

void Supervisor::TerminateAll(std::chrono::milliseconds grace) {
  const bool first = !terminating_;
  terminating_ = true;
  bool any_stopping = false;
  for (auto& record : records_) {
    if (record.state == UnitState::kRunning) {
      Transition(record, UnitState::kStopping);
      record.unit->Terminate();
      observability_->Event(LogLevel::kInfo, "supervisor", "terminate_sent", {{"unit", record.unit->Name()}});
    }
    any_stopping = any_stopping || record.state == UnitState::kStopping;
  }
  if (first && any_stopping) {
    grace_timer_.expires_after(grace);
    grace_timer_.async_wait([this](const boost::system::error_code& ec) {
      if (ec) {
        return;
      }
      OnGraceExpired();
    });
  }
}

SupervisionOutcome Supervisor::Join() {
  while (true) {
    RunUntil([this]() {
      return AllSettled() || ((shutdown_requested_ || unexpected_exit_ || launch_failed_) && !terminating_);
    });
    if (AllSettled()) {
      break;
    }
    TerminateAll(options_.grace_period);
  }
  grace_timer_.cancel();
  boost::system::error_code ignored;
  signals_.cancel(ignored);

  nlohmann::json units = nlohmann::json::array();
  for (const auto& record : records_) {
    nlohmann::json entry{{"unit", record.unit->Name()}, {"state", ToString(record.state)}};
    if (record.last_exit) {
      entry["exit"] = record.last_exit->Describe();
    }
    units.push_back(entry);
  }
  observability_->Event(outcome_.success ? LogLevel::kInfo : LogLevel::kError, "supervisor", "group_stopped",
                        {{"success", outcome_.success},
                         {"failedUnit", outcome_.failed_unit},
                         {"reason", ToString(outcome_.reason)},
                         {"detail", outcome_.detail},
                         {"units", units}});
  return outcome_;
}

SupervisionOutcome Supervisor::Run() {
  Start();
  auto event = AwaitAny();
  if (event.kind == SupervisorEvent::Kind::kShutdownRequested) {
    observability_->Event(LogLevel::kInfo, "supervisor", "shutdown_started");
  }
  TerminateAll(options_.grace_period);
  return Join();
}

void Supervisor::RequestShutdown() {
  boost::asio::post(ioc_, [this]() { OnShutdownRequested("request"); });
}

std::vector<UnitStatus> Supervisor::Statuses() const {
  std::vector<UnitStatus> statuses;
  statuses.reserve(records_.size());
  for (const auto& record : records_) {
    statuses.push_back(UnitStatus{record.unit->Name(), record.state, record.last_exit});
  }
  return statuses;
}

void Supervisor::WaitForSignal() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
    if (ec) {
      return;
    }
    OnShutdownRequested("signal " + std::to_string(signo));
    WaitForSignal();
  });
}

void Supervisor::OnShutdownRequested(const std::string& source) {
  if (!shutdown_requested_) {
    shutdown_requested_ = true;
    observability_->Event(LogLevel::kInfo, "supervisor", "shutdown_requested", {{"source", source}});
    return;
  }
  if (terminating_) {
    KillRemaining("종료 요청이 반복되어 강제 종료했습니다");
  }
}

void Supervisor::OnUnitExit(std::size_t index, const UnitExit& exit) {
  auto& record = records_[index];
  if (IsTerminal(record.state)) {
    return;
  }
  const std::string& name = record.unit->Name();
  record.last_exit = exit;
  observability_->Event(LogLevel::kInfo, "supervisor", "unit_exited",
                        {{"unit", name}, {"exit", exit.Describe()}, {"state", ToString(record.state)}});

  if (record.state == UnitState::kStopping) {
    if (record.kill_sent) {
      Transition(record, UnitState::kKilled);
    } else {
      Transition(record, UnitState::kStopped);
      if (!exit.IsCleanShutdown()) {
        RecordFailure(name, FailureReason::kUncleanExit, exit.Describe());
      }
    }
  } else if (record.state == UnitState::kRunning && shutdown_requested_ && exit.IsCleanShutdown()) {
    // 종료 요청과 거의 동시에 스스로 정상 종료한 경우.
    Transition(record, UnitState::kStopping);
    Transition(record, UnitState::kStopped);
  } else {
    Transition(record, UnitState::kCrashed);
    unexpected_exit_ = true;
    RecordFailure(name, FailureReason::kUnexpectedExit, exit.Describe());
  }

  if (AllSettled()) {
    grace_timer_.cancel();
  }
}

void Supervisor::OnGraceExpired() {
  observability_->Event(LogLevel::kWarn, "supervisor", "grace_expired");
  KillRemaining("유예 시간 안에 종료되지 않아 강제 종료했습니다");
}

void Supervisor::KillRemaining(const std::string& detail) {
  for (auto& record : records_) {
    if (record.state != UnitState::kStopping || record.kill_sent) {
      continue;
    }
    record.kill_sent = true;
    RecordFailure(record.unit->Name(), FailureReason::kKilledAfterGrace, detail);
    record.unit->Kill();
    observability_->Event(LogLevel::kWarn, "supervisor", "kill_sent", {{"unit", record.unit->Name()}});
  }
}

void Supervisor::Transition(UnitRecord& record, UnitState next) {
  if (!IsAllowedTransition(record.state, next)) {
    observability_->Event(LogLevel::kWarn, "supervisor", "illegal_transition",
                          {{"unit", record.unit->Name()}, {"from", ToString(record.state)}, {"to", ToString(next)}});
    return;
  }
  record.state = next;
}

void Supervisor::RecordFailure(const std::string& unit, FailureReason reason, const std::string& detail) {
  observability_->Event(LogLevel::kError, "supervisor", "unit_failure",
                        {{"unit", unit}, {"reason", ToString(reason)}, {"detail", detail}});
  if (outcome_.reason != FailureReason::kNone) {
    return;
  }
  outcome_.success = false;
  outcome_.failed_unit = unit;
  outcome_.reason = reason;
  outcome_.detail = detail;
}

bool Supervisor::AllSettled() const {
  for (const auto& record : records_) {
    if (!IsTerminal(record.state) && record.state != UnitState::kIdle) {
      return false;
    }
  }
  return true;
}

}  // namespace roomkey
