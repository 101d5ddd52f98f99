/*
 * 설명: 자식 프로세스 생성, 신호 전달, SIGCHLD 기반 종료 감지를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/process_supervisor_it_test.cpp
 */
#include "roomkey/process_unit.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace roomkey {

namespace {
UnitExit ToUnitExit(int status) {
  if (WIFSIGNALED(status)) {
    return UnitExit{UnitExit::Kind::kSignaled, WTERMSIG(status)};
  }
  return UnitExit{UnitExit::Kind::kExited, WIFEXITED(status) ? WEXITSTATUS(status) : -1};
}
}  // namespace

ProcessUnit::ProcessUnit(boost::asio::io_context& ioc, UnitCommand command,
                         std::shared_ptr<Observability> observability)
    : command_(std::move(command)), child_signal_(ioc), observability_(std::move(observability)) {}

ProcessUnit::~ProcessUnit() {
  boost::system::error_code ignored;
  child_signal_.cancel(ignored);
  if (pid_ > 0 && !reaped_) {
    SendSignal(SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
}

void ProcessUnit::Launch(ExitHandler on_exit) {
  if (command_.argv.empty()) {
    throw SpawnError(command_.name, "실행 명령이 비어 있습니다");
  }
  if (pid_ > 0) {
    throw SpawnError(command_.name, "이미 실행된 유닛은 다시 시작할 수 없습니다");
  }
  on_exit_ = std::move(on_exit);

  // fork 이전에 등록해야 자식이 곧바로 끝나도 SIGCHLD를 놓치지 않는다.
  boost::system::error_code ec;
  child_signal_.add(SIGCHLD, ec);
  if (ec) {
    throw SpawnError(command_.name, "SIGCHLD 등록 실패: " + ec.message());
  }

  std::vector<char*> argv;
  argv.reserve(command_.argv.size() + 1);
  for (auto& arg : command_.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    throw SpawnError(command_.name, std::string("pipe 생성 실패: ") + std::strerror(errno));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    throw SpawnError(command_.name, std::string("fork 실패: ") + std::strerror(err));
  }
  if (pid == 0) {
    /* child: 자체 프로세스 그룹으로 분리해 터미널 인터럽트는 슈퍼바이저만 받게 한다 */
    close(fds[0]);
    setpgid(0, 0);
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t written = write(fds[1], &err, sizeof(err));
    (void)written;
    _exit(127);
  }

  close(fds[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(fds[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(fds[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw SpawnError(command_.name, "exec 실패 (" + command_.argv.front() + "): " + std::strerror(child_errno));
  }

  pid_ = pid;
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "supervisor", "unit_spawned",
                          {{"unit", command_.name}, {"pid", pid_}, {"command", command_.argv}});
  }
  WaitForExit();
}

void ProcessUnit::WaitForExit() {
  child_signal_.async_wait([this](const boost::system::error_code& ec, int /*signo*/) {
    if (ec) {
      return;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0 || (r < 0 && errno == EINTR)) {
      WaitForExit();
      return;
    }
    reaped_ = true;
    UnitExit exit = r == pid_ ? ToUnitExit(status) : UnitExit{UnitExit::Kind::kExited, -1};
    boost::system::error_code ignored;
    child_signal_.clear(ignored);
    auto handler = std::move(on_exit_);
    on_exit_ = nullptr;
    if (handler) {
      handler(exit);
    }
  });
}

void ProcessUnit::Terminate() { SendSignal(SIGTERM); }

void ProcessUnit::Kill() { SendSignal(SIGKILL); }

void ProcessUnit::SendSignal(int signo) {
  if (pid_ <= 0 || reaped_) {
    return;
  }
  // 그룹 전체에 보내 손자 프로세스까지 정리한다.
  if (kill(-pid_, signo) == 0) {
    return;
  }
  if (kill(pid_, signo) != 0 && errno != ESRCH && observability_) {
    observability_->Event(LogLevel::kWarn, "supervisor", "signal_failed",
                          {{"unit", command_.name}, {"signal", signo}, {"error", std::strerror(errno)}});
  }
}

}  // namespace roomkey
