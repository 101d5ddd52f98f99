/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#include "roomkey/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "roomkey/api_response.hpp"

namespace roomkey {

namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementIssued() { tokens_issued_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.tokens_issued = tokens_issued_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  Write(log_json, ctx.status >= 500 ? LogLevel::kError : LogLevel::kInfo);
}

void Observability::Event(LogLevel level, std::string_view component, std::string_view event,
                          const nlohmann::json& fields) const {
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["component"] = component;
  log_json["eventName"] = event;
  Write(log_json, level);
}

void Observability::Write(const nlohmann::json& line, LogLevel level) const {
  if (level < min_level_) {
    return;
  }
  nlohmann::json out = line;
  out["ts"] = FormatIsoTimestamp(std::chrono::system_clock::now());
  out["level"] = LevelName(level);
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cout << SerializeJson(out) << std::endl;
}

}  // namespace roomkey
