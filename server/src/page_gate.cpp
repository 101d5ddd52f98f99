/*
 * 설명: 공유 비밀번호 확인과 만료 기반 세션 저장을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/page_gate_test.cpp
 */
#include "roomkey/page_gate.hpp"

#include <utility>

#include <openssl/crypto.h>

#include "roomkey/room_namer.hpp"

namespace roomkey {

PageGate::PageGate(PageGateConfig config) : config_(std::move(config)) {}

std::optional<GateSession> PageGate::VerifyPassword(const std::string& password,
                                                    std::chrono::system_clock::time_point now) {
  if (!config_.bypass && (password.empty() || !MatchesAny(password))) {
    return std::nullopt;
  }
  GateSession session;
  session.token = RandomHex(32);
  session.expires_at = now + config_.session_ttl;

  std::lock_guard<std::mutex> lock(mutex_);
  CleanupExpired(now);
  sessions_[session.token] = session;
  return session;
}

bool PageGate::IsAuthenticated(const std::string& token, std::chrono::system_clock::time_point now) {
  if (config_.bypass) {
    return true;
  }
  if (token.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(token);
  if (it == sessions_.end()) {
    return false;
  }
  if (now >= it->second.expires_at) {
    sessions_.erase(it);
    return false;
  }
  return true;
}

std::size_t PageGate::ActiveSessions(std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  CleanupExpired(now);
  return sessions_.size();
}

bool PageGate::MatchesAny(const std::string& password) const {
  // 일치 여부와 무관하게 모든 후보를 비교한다.
  bool matched = false;
  for (const auto& candidate : config_.passwords) {
    if (candidate.size() == password.size() &&
        CRYPTO_memcmp(candidate.data(), password.data(), candidate.size()) == 0) {
      matched = true;
    }
  }
  return matched;
}

void PageGate::CleanupExpired(std::chrono::system_clock::time_point now) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now >= it->second.expires_at) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace roomkey
