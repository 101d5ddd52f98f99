#include <string>
#include <unordered_set>

#include <gtest/gtest.h>

#include "roomkey/room_namer.hpp"

TEST(RoomNamerTest, FormatMatchesPrefixAndLength) {
  auto room = roomkey::NewRoomName();
  EXPECT_EQ(room.rfind("room-", 0), 0u);
  EXPECT_EQ(room.size(), 5u + roomkey::kRoomSuffixLength);
  EXPECT_TRUE(roomkey::IsValidRoomName(room));
}

TEST(RoomNamerTest, TenThousandCallsAreValidAndDistinct) {
  std::unordered_set<std::string> seen;
  for (int i = 0; i < 10000; ++i) {
    auto room = roomkey::NewRoomName();
    ASSERT_TRUE(roomkey::IsValidRoomName(room)) << room;
    ASSERT_TRUE(seen.insert(room).second) << "중복 방 이름: " << room;
  }
  EXPECT_EQ(seen.size(), 10000u);
}

TEST(RoomNamerTest, RejectsMalformedNames) {
  EXPECT_FALSE(roomkey::IsValidRoomName(""));
  EXPECT_FALSE(roomkey::IsValidRoomName("room-"));
  EXPECT_FALSE(roomkey::IsValidRoomName("room-0123456789ab0"));
  EXPECT_FALSE(roomkey::IsValidRoomName("room-0123456789AB"));
  EXPECT_FALSE(roomkey::IsValidRoomName("hall-0123456789ab"));
  EXPECT_TRUE(roomkey::IsValidRoomName("room-0123456789ab"));
}
