/*
 * 설명: 유닛 상태 전이 규칙과 종료 상태 표현을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/supervisor_test.cpp
 */
#include "roomkey/unit.hpp"

#include <csignal>
#include <cstring>

namespace roomkey {

const char* ToString(UnitState state) {
  switch (state) {
    case UnitState::kIdle:
      return "idle";
    case UnitState::kStarting:
      return "starting";
    case UnitState::kRunning:
      return "running";
    case UnitState::kStopping:
      return "stopping";
    case UnitState::kStopped:
      return "stopped";
    case UnitState::kCrashed:
      return "crashed";
    case UnitState::kKilled:
      return "killed";
  }
  return "unknown";
}

bool IsTerminal(UnitState state) {
  return state == UnitState::kStopped || state == UnitState::kCrashed || state == UnitState::kKilled;
}

bool IsAllowedTransition(UnitState from, UnitState to) {
  switch (from) {
    case UnitState::kIdle:
      return to == UnitState::kStarting;
    case UnitState::kStarting:
      return to == UnitState::kRunning || to == UnitState::kCrashed;
    case UnitState::kRunning:
      return to == UnitState::kStopping || to == UnitState::kCrashed;
    case UnitState::kStopping:
      return to == UnitState::kStopped || to == UnitState::kKilled;
    default:
      return false;
  }
}

bool UnitExit::IsCleanShutdown() const {
  if (kind == Kind::kExited) {
    return code == 0;
  }
  return code == SIGTERM || code == SIGINT;
}

std::string UnitExit::Describe() const {
  if (kind == Kind::kExited) {
    return "exit code " + std::to_string(code);
  }
  const char* name = strsignal(code);
  return "signal " + std::to_string(code) + (name ? std::string(" (") + name + ")" : std::string{});
}

}  // namespace roomkey
