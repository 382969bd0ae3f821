/// @file test_types.cpp
/// Tests for core enumerations.

#include <chessterm/types.hpp>

#include <gtest/gtest.h>

namespace chessterm {
namespace {

TEST(TypesTest, OppositeSide) {
    EXPECT_EQ(opposite(Side::White), Side::Black);
    EXPECT_EQ(opposite(Side::Black), Side::White);
    static_assert(opposite(opposite(Side::White)) == Side::White);
}

TEST(TypesTest, SideIndex) {
    EXPECT_EQ(side_index(Side::White), 0);
    EXPECT_EQ(side_index(Side::Black), 1);
}

TEST(TypesTest, Names) {
    EXPECT_EQ(side_name(Side::White), "White");
    EXPECT_EQ(side_name(Side::Black), "Black");
    EXPECT_EQ(state_name(DriverState::Ready), "ready");
    EXPECT_EQ(state_name(DriverState::Searching), "searching");
    EXPECT_EQ(state_name(DriverState::Closed), "closed");
}

}  // namespace
}  // namespace chessterm
