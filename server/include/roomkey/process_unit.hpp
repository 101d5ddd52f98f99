/*
 * 설명: fork/exec로 띄운 OS 프로세스를 Unit으로 감싼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/process_supervisor_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "roomkey/config.hpp"
#include "roomkey/observability.hpp"
#include "roomkey/unit.hpp"

namespace roomkey {

class ProcessUnit : public Unit {
 public:
  ProcessUnit(boost::asio::io_context& ioc, UnitCommand command, std::shared_ptr<Observability> observability);
  // 아직 살아 있는 자식은 SIGKILL 후 회수한다.
  ~ProcessUnit() override;

  const std::string& Name() const override { return command_.name; }
  void Launch(ExitHandler on_exit) override;
  void Terminate() override;
  void Kill() override;

  pid_t Pid() const { return pid_; }

 private:
  void WaitForExit();
  void SendSignal(int signo);

  UnitCommand command_;
  boost::asio::signal_set child_signal_;
  std::shared_ptr<Observability> observability_;
  ExitHandler on_exit_;
  pid_t pid_{-1};
  bool reaped_{false};
};

}  // namespace roomkey
