/*
 * 설명: 슈퍼바이저가 관리하는 유닛의 추상 인터페이스와 상태/종료 정보를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/supervisor_test.cpp, server/tests/it/process_supervisor_it_test.cpp
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace roomkey {

enum class UnitState {
  kIdle,
  kStarting,
  kRunning,
  kStopping,
  kStopped,
  kCrashed,
  kKilled,
};

const char* ToString(UnitState state);
bool IsTerminal(UnitState state);
// 상태는 앞으로만 진행하며 종료 상태에서 다시 kRunning으로 돌아가지 않는다.
bool IsAllowedTransition(UnitState from, UnitState to);

struct UnitExit {
  enum class Kind { kExited, kSignaled };
  Kind kind{Kind::kExited};
  int code{0};

  // 종료 요청 이후라면 정상 종료로 보는 경우: exit 0, SIGTERM, SIGINT.
  bool IsCleanShutdown() const;
  std::string Describe() const;
};

class SpawnError : public std::runtime_error {
 public:
  SpawnError(const std::string& unit, const std::string& message)
      : std::runtime_error(unit + ": " + message), unit(unit) {}
  std::string unit;
};

using ExitHandler = std::function<void(const UnitExit&)>;

class Unit {
 public:
  virtual ~Unit() = default;

  virtual const std::string& Name() const = 0;
  // 실패하면 SpawnError. on_exit은 슈퍼바이저의 io_context 스레드에서 한 번만 호출된다.
  virtual void Launch(ExitHandler on_exit) = 0;
  virtual void Terminate() = 0;
  virtual void Kill() = 0;
};

}  // namespace roomkey
