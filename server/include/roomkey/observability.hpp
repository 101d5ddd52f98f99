/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace roomkey {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);

struct LogContext {
  std::string trace_id;
  std::string name;
  unsigned status{0};
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t tokens_issued{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementIssued();
  MetricsSnapshot Snapshot() const;

  // 요청 단위 접근 로그.
  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, std::string_view component, std::string_view event,
             const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  void Write(const nlohmann::json& line, LogLevel level) const;

  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> tokens_issued_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex write_mutex_;
};

}  // namespace roomkey
