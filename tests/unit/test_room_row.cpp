#include "dal/RoomRepository.hpp"

#include <gtest/gtest.h>

using roommates::dal::RoomRow;

TEST(RoomRowTest, DefaultsToUnassignedId) {
  RoomRow rr;
  EXPECT_EQ(rr.iId, 0);
  EXPECT_TRUE(rr.sName.empty());
  EXPECT_EQ(rr.iMaxOccupancy, 0);
}

TEST(RoomRowTest, EqualityComparesAllFields) {
  RoomRow rrA{1, "Maple", 2};
  RoomRow rrB{1, "Maple", 2};
  EXPECT_EQ(rrA, rrB);

  rrB.iMaxOccupancy = 3;
  EXPECT_NE(rrA, rrB);

  rrB = rrA;
  rrB.iId = 2;
  EXPECT_NE(rrA, rrB);
}
