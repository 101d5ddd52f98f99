/*
 * 설명: OpenSSL 난수로 방 식별자를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_namer_test.cpp
 */
#include "roomkey/room_namer.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/rand.h>

#include "roomkey/token_error.hpp"

namespace roomkey {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw TokenError(TokenErrorCode::kRandomnessUnavailable, "난수 소스를 사용할 수 없습니다");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string NewRoomName() { return kRoomPrefix + RandomHex(kRoomSuffixLength / 2); }

bool IsValidRoomName(const std::string& room) {
  const std::size_t prefix_len = std::strlen(kRoomPrefix);
  if (room.size() != prefix_len + kRoomSuffixLength || room.compare(0, prefix_len, kRoomPrefix) != 0) {
    return false;
  }
  for (std::size_t i = prefix_len; i < room.size(); ++i) {
    char c = room[i];
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

}  // namespace roomkey
