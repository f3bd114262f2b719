#include "war/LineRecord.hh"

#include <gtest/gtest.h>

#include <sstream>

using namespace WarCheck;

namespace {
constexpr auto CARD = Card {Rank::TEN, Suit::HEARTS};
}

TEST(LineRecordTest, testCategory)
{
    EXPECT_EQ(LineCategory::ROUND, getCategory(RoundLine {1}));
    EXPECT_EQ(LineCategory::FACE_DOWN_CARD,
              getCategory(FaceDownCardLine {CARD}));
    EXPECT_EQ(LineCategory::CONTINUING_WAR,
              getCategory(ContinuingWarLine {}));
    EXPECT_EQ(LineCategory::MALFORMED, getCategory(MalformedLine {"x"}));
}

TEST(LineRecordTest, testPlayerNumber)
{
    EXPECT_EQ(2, getPlayerNumber(PlayerLabelLine {2}));
    EXPECT_EQ(1, getPlayerNumber(RoundWinnerLine {1, CARD}));
    EXPECT_EQ(2, getPlayerNumber(GameWinnerLine {2, 52}));
    EXPECT_FALSE(getPlayerNumber(RoundLine {2}));
    EXPECT_FALSE(getPlayerNumber(FaceUpCardLine {CARD}));
}

TEST(LineRecordTest, testRendering)
{
    EXPECT_EQ("Round 3", renderLine(RoundLine {3}));
    EXPECT_EQ("Player 1:", renderLine(PlayerLabelLine {1}));
    EXPECT_EQ("- Ten of Hearts", renderLine(FaceUpCardLine {CARD}));
    EXPECT_EQ("- Ten of Hearts (face down)",
              renderLine(FaceDownCardLine {CARD}));
    EXPECT_EQ("Round winner: Player 2 (Ten of Hearts)",
              renderLine(RoundWinnerLine {2, CARD}));
    EXPECT_EQ("Commencing war...", renderLine(CommencingWarLine {}));
    EXPECT_EQ("Round 4, War 2", renderLine(WarRoundLine {4, 2}));
    EXPECT_EQ("Continuing war...", renderLine(ContinuingWarLine {}));
    EXPECT_EQ("Player 1 wins with 52 cards in their deck",
              renderLine(GameWinnerLine {1, 52}));
    EXPECT_EQ("The game ended in a draw", renderLine(DrawLine {}));
    EXPECT_EQ("", renderLine(EmptyLine {}));
}

TEST(LineRecordTest, testEquality)
{
    const auto record = LineRecord {WarRoundLine {1, 2}};
    EXPECT_EQ(record, (LineRecord {WarRoundLine {1, 2}}));
    EXPECT_NE(record, (LineRecord {WarRoundLine {2, 1}}));
    EXPECT_NE(LineRecord {RoundLine {1}}, LineRecord {PlayerLabelLine {1}});
}

TEST(LineRecordTest, testCategoryOutput)
{
    std::ostringstream os;
    os << LineCategory::ROUND_WINNER;
    EXPECT_EQ("round winner", os.str());
}
