/*
 * 설명: 면접 페이지 접근용 공유 비밀번호 게이트와 브라우저 세션을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/page_gate_test.cpp, server/tests/unit/token_handler_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomkey {

constexpr const char* kGateCookieName = "roomkey_session";

struct PageGateConfig {
  std::vector<std::string> passwords;
  std::chrono::seconds session_ttl{std::chrono::minutes(30)};
  // development 환경. 비밀번호 확인 없이 항상 인증된 것으로 본다.
  bool bypass{false};
};

struct GateSession {
  std::string token;
  std::chrono::system_clock::time_point expires_at;
};

class PageGate {
 public:
  explicit PageGate(PageGateConfig config);

  bool BypassEnabled() const { return config_.bypass; }
  std::chrono::seconds SessionTtl() const { return config_.session_ttl; }

  // 비밀번호가 목록에 있으면 새 세션을 만든다. 우회 모드에서는 비밀번호를 보지 않는다.
  // 세션 토큰 생성에 실패하면 TokenError(kRandomnessUnavailable).
  std::optional<GateSession> VerifyPassword(const std::string& password, std::chrono::system_clock::time_point now);
  bool IsAuthenticated(const std::string& token, std::chrono::system_clock::time_point now);
  std::size_t ActiveSessions(std::chrono::system_clock::time_point now);

 private:
  bool MatchesAny(const std::string& password) const;
  void CleanupExpired(std::chrono::system_clock::time_point now);

  PageGateConfig config_;
  std::mutex mutex_;
  std::unordered_map<std::string, GateSession> sessions_;
};

}  // namespace roomkey
