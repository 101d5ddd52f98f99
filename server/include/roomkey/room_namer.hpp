/*
 * 설명: 충돌 가능성이 무시할 수준인 방 식별자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_namer_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace roomkey {

constexpr const char* kRoomPrefix = "room-";
constexpr std::size_t kRoomSuffixLength = 12;

// OpenSSL CSPRNG에서 bytes 바이트를 읽어 소문자 16진수로 돌려준다. 실패 시 TokenError.
std::string RandomHex(std::size_t bytes);

// "room-" 뒤에 소문자 16진수 12자를 붙인다. 난수 소스 실패 시 TokenError를 던진다.
std::string NewRoomName();

bool IsValidRoomName(const std::string& room);

}  // namespace roomkey
