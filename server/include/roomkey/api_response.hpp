/*
 * 설명: REST 응답 엔벨로프 생성과 JSON 직렬화를 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace roomkey {

constexpr const char* kServiceName = "roomkey";
constexpr const char* kServiceVersion = "v1.1.0";

// UTC 초 단위 ISO-8601 ("2024-05-01T09:30:00Z").
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// 요청에서 온 문자열이 섞일 수 있으므로 잘못된 UTF-8 바이트는 U+FFFD로 바꿔 쓴다. 예외를 던지지 않는다.
std::string SerializeJson(const nlohmann::json& value);

}  // namespace roomkey
