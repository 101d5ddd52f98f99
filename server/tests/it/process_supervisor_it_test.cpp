#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <gtest/gtest.h>

#include "roomkey/config.hpp"
#include "roomkey/process_unit.hpp"
#include "roomkey/supervisor.hpp"

namespace {

using namespace std::chrono_literals;

class ProcessSupervisorTest : public ::testing::Test {
 protected:
  void AddShell(const std::string& name, const std::string& script) {
    units_.push_back(std::make_unique<roomkey::ProcessUnit>(
        ioc_, roomkey::UnitCommand{name, {"/bin/sh", "-c", script}}, observability_));
  }

  void AddCommand(const std::string& name, std::vector<std::string> argv) {
    units_.push_back(
        std::make_unique<roomkey::ProcessUnit>(ioc_, roomkey::UnitCommand{name, std::move(argv)}, observability_));
  }

  std::unique_ptr<roomkey::Supervisor> Make(std::chrono::milliseconds grace) {
    roomkey::SupervisorOptions options;
    options.grace_period = grace;
    options.handle_signals = false;
    return std::make_unique<roomkey::Supervisor>(ioc_, std::move(units_), options, observability_);
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<roomkey::Observability> observability_ =
      std::make_shared<roomkey::Observability>(roomkey::LogLevel::kWarn);
  std::vector<std::unique_ptr<roomkey::Unit>> units_;
};

TEST_F(ProcessSupervisorTest, ImmediateNonZeroExitTerminatesSibling) {
  AddShell("session-handler", "exec sleep 30");
  AddShell("token-service", "exit 7");
  auto supervisor = Make(2s);

  auto started = std::chrono::steady_clock::now();
  auto outcome = supervisor->Run();

  EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.failed_unit, "token-service");
  EXPECT_EQ(outcome.reason, roomkey::FailureReason::kUnexpectedExit);
  EXPECT_NE(outcome.detail.find("exit code 7"), std::string::npos);

  auto statuses = supervisor->Statuses();
  ASSERT_EQ(statuses.size(), 2u);
  EXPECT_EQ(statuses[0].state, roomkey::UnitState::kStopped);
  ASSERT_TRUE(statuses[0].last_exit.has_value());
  EXPECT_EQ(statuses[0].last_exit->kind, roomkey::UnitExit::Kind::kSignaled);
  EXPECT_EQ(statuses[0].last_exit->code, SIGTERM);
  EXPECT_EQ(statuses[1].state, roomkey::UnitState::kCrashed);
}

TEST_F(ProcessSupervisorTest, ShutdownRequestStopsHealthyUnits) {
  AddShell("session-handler", "exec sleep 30");
  AddShell("token-service", "trap 'exit 0' TERM; while true; do sleep 0.1; done");
  auto supervisor = Make(5s);

  boost::asio::steady_timer timer(ioc_, 300ms);
  timer.async_wait([&supervisor](const boost::system::error_code& ec) {
    if (!ec) {
      supervisor->RequestShutdown();
    }
  });

  auto outcome = supervisor->Run();

  EXPECT_TRUE(outcome.success) << outcome.failed_unit << ": " << outcome.detail;
  for (const auto& status : supervisor->Statuses()) {
    EXPECT_EQ(status.state, roomkey::UnitState::kStopped) << status.name;
  }
}

TEST_F(ProcessSupervisorTest, UnitIgnoringSigtermIsKilled) {
  AddShell("session-handler", "exec sleep 30");
  AddShell("token-service", "trap '' TERM; sleep 30");
  auto supervisor = Make(500ms);

  boost::asio::steady_timer timer(ioc_, 300ms);
  timer.async_wait([&supervisor](const boost::system::error_code& ec) {
    if (!ec) {
      supervisor->RequestShutdown();
    }
  });

  auto started = std::chrono::steady_clock::now();
  auto outcome = supervisor->Run();
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(elapsed, 10s);
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.failed_unit, "token-service");
  EXPECT_EQ(outcome.reason, roomkey::FailureReason::kKilledAfterGrace);
  auto statuses = supervisor->Statuses();
  EXPECT_EQ(statuses[0].state, roomkey::UnitState::kStopped);
  EXPECT_EQ(statuses[1].state, roomkey::UnitState::kKilled);
  ASSERT_TRUE(statuses[1].last_exit.has_value());
  EXPECT_EQ(statuses[1].last_exit->code, SIGKILL);
}

TEST_F(ProcessSupervisorTest, SingleQuotedConfigCommandKeepsItsExitCode) {
  AddCommand("session-handler", roomkey::SplitCommandLine("sleep 30"));
  AddCommand("token-service", roomkey::SplitCommandLine("sh -c 'exit 3'"));
  auto supervisor = Make(2s);

  auto outcome = supervisor->Run();

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.failed_unit, "token-service");
  EXPECT_EQ(outcome.reason, roomkey::FailureReason::kUnexpectedExit);
  EXPECT_NE(outcome.detail.find("exit code 3"), std::string::npos) << outcome.detail;
}

TEST_F(ProcessSupervisorTest, MissingBinaryIsLaunchFailure) {
  AddShell("session-handler", "exec sleep 30");
  AddCommand("token-service", {"/nonexistent/roomkey-token-server"});
  auto supervisor = Make(2s);

  auto outcome = supervisor->Run();

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.failed_unit, "token-service");
  EXPECT_EQ(outcome.reason, roomkey::FailureReason::kLaunchFailed);
  EXPECT_NE(outcome.detail.find("exec"), std::string::npos);
  EXPECT_EQ(supervisor->Statuses()[0].state, roomkey::UnitState::kStopped);
}

}  // namespace
