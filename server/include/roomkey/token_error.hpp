/*
 * 설명: 방 이름 생성과 자격 증명 발급 중 발생하는 오류 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credential_issuer_test.cpp, server/tests/unit/token_handler_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace roomkey {

enum class TokenErrorCode {
  kRandomnessUnavailable,
  kMissingSigningKey,
  kInvalidRoom,
};

class TokenError : public std::runtime_error {
 public:
  TokenError(TokenErrorCode code, const std::string& message) : std::runtime_error(message), code(code) {}
  TokenErrorCode code;
};

// HTTP 오류 엔벨로프에 들어가는 코드 문자열.
const char* ToErrorCode(TokenErrorCode code);

}  // namespace roomkey
