#include "validation/LineClassifier.hh"
#include "war/WarConstants.hh"
#include "Utility.hh"

#include <gtest/gtest.h>

#include <string>

using namespace WarCheck;
using Validation::classify;
using Validation::ClassifierConfig;
using Validation::LineClassifier;

namespace {
constexpr auto ACE_OF_SPADES = Card {Rank::ACE, Suit::SPADES};
constexpr auto KING_OF_CLUBS = Card {Rank::KING, Suit::CLUBS};
}

TEST(LineClassifierTest, testRound)
{
    EXPECT_EQ(LineRecord {RoundLine {12}}, classify("Round 12"));
}

TEST(LineClassifierTest, testPlayerLabel)
{
    EXPECT_EQ(LineRecord {PlayerLabelLine {2}}, classify("Player 2:"));
}

TEST(LineClassifierTest, testFaceUpCard)
{
    EXPECT_EQ(
        LineRecord {FaceUpCardLine {ACE_OF_SPADES}},
        classify("- Ace of Spades"));
}

TEST(LineClassifierTest, testFaceDownCard)
{
    EXPECT_EQ(
        LineRecord {FaceDownCardLine {KING_OF_CLUBS}},
        classify("- King of Clubs (face down)"));
}

TEST(LineClassifierTest, testRoundWinner)
{
    EXPECT_EQ(
        (LineRecord {RoundWinnerLine {1, KING_OF_CLUBS}}),
        classify("Round winner: Player 1 (King of Clubs)"));
}

TEST(LineClassifierTest, testCommencingWar)
{
    EXPECT_EQ(LineRecord {CommencingWarLine {}}, classify("Commencing war..."));
}

TEST(LineClassifierTest, testWarRound)
{
    EXPECT_EQ((LineRecord {WarRoundLine {5, 2}}), classify("Round 5, War 2"));
}

TEST(LineClassifierTest, testContinuingWar)
{
    EXPECT_EQ(LineRecord {ContinuingWarLine {}}, classify("Continuing war..."));
}

TEST(LineClassifierTest, testGameWinner)
{
    EXPECT_EQ(
        (LineRecord {GameWinnerLine {2, 52}}),
        classify("Player 2 wins with 52 cards in their deck"));
}

TEST(LineClassifierTest, testDraw)
{
    EXPECT_EQ(LineRecord {DrawLine {}}, classify("The game ended in a draw"));
}

TEST(LineClassifierTest, testSurroundingWhitespaceIsIgnored)
{
    EXPECT_EQ(LineRecord {RoundLine {1}}, classify("  Round 1\t\r"));
}

TEST(LineClassifierTest, testEmptyLine)
{
    EXPECT_EQ(LineRecord {EmptyLine {}}, classify(""));
    EXPECT_EQ(LineRecord {EmptyLine {}}, classify(" \t "));
}

TEST(LineClassifierTest, testEmbeddedNewlineIsMalformed)
{
    EXPECT_EQ(
        LineRecord {MalformedLine {"Round 1\nRound 2"}},
        classify("Round 1\nRound 2"));
    EXPECT_EQ(LineRecord {MalformedLine {"\n"}}, classify("\n"));
}

TEST(LineClassifierTest, testMalformedLineKeepsOriginalText)
{
    EXPECT_EQ(
        LineRecord {MalformedLine {"  Round one "}}, classify("  Round one "));
}

TEST(LineClassifierTest, testUnknownRankIsMalformed)
{
    EXPECT_EQ(
        LineCategory::MALFORMED, getCategory(classify("- Knight of Spades")));
    EXPECT_EQ(
        LineCategory::MALFORMED, getCategory(classify("- ace of spades")));
}

TEST(LineClassifierTest, testUnknownPlayerIsMalformed)
{
    EXPECT_EQ(LineCategory::MALFORMED, getCategory(classify("Player 3:")));
    EXPECT_EQ(
        LineCategory::MALFORMED,
        getCategory(classify("Round winner: Player 0 (Ace of Spades)")));
}

TEST(LineClassifierTest, testIntegerOverflowIsMalformed)
{
    EXPECT_EQ(
        LineCategory::MALFORMED,
        getCategory(classify("Round 99999999999999999999")));
}

TEST(LineClassifierTest, testCardCountOutOfRangeIsMalformed)
{
    EXPECT_EQ(
        LineCategory::MALFORMED,
        getCategory(classify("Player 1 wins with 53 cards in their deck")));
}

TEST(LineClassifierTest, testExtraTextIsMalformed)
{
    EXPECT_EQ(LineCategory::MALFORMED, getCategory(classify("Round 1 2")));
    EXPECT_EQ(LineCategory::MALFORMED, getCategory(classify("Player 1")));
    EXPECT_EQ(
        LineCategory::MALFORMED, getCategory(classify("Commencing war.")));
}

TEST(LineClassifierTest, testOverlongLineIsMalformed)
{
    const auto text = "- " + std::string(100000, 'A') + " of Spades";
    EXPECT_EQ(LineRecord {MalformedLine {text}}, classify(text));
}

TEST(LineClassifierTest, testLineAtLengthLimit)
{
    const auto prefix = std::string {"Round "};
    const auto n_zeros = Validation::MAX_LINE_LENGTH - prefix.size() - 1;
    const auto text = prefix + std::string(n_zeros, '0') + "7";
    ASSERT_EQ(Validation::MAX_LINE_LENGTH, text.size());
    EXPECT_EQ(LineRecord {RoundLine {7}}, classify(text));
    EXPECT_EQ(LineCategory::MALFORMED, getCategory(classify(text + "7")));
}

TEST(LineClassifierTest, testWhitespaceDoesNotCountTowardsLengthLimit)
{
    EXPECT_EQ(
        LineRecord {RoundLine {1}},
        classify(std::string(1000, ' ') + "Round 1" + std::string(500, '\t')));
}

TEST(LineClassifierTest, testConfiguredPlayerNumbers)
{
    const auto classifier = LineClassifier {ClassifierConfig {{1, 2, 3}, 52}};
    EXPECT_EQ(
        LineRecord {PlayerLabelLine {3}}, classifier.classify("Player 3:"));
}

TEST(LineClassifierTest, testConfiguredMaxCards)
{
    const auto classifier = LineClassifier {ClassifierConfig {{1, 2}, 10}};
    EXPECT_EQ(
        (LineRecord {GameWinnerLine {1, 10}}),
        classifier.classify("Player 1 wins with 10 cards in their deck"));
    EXPECT_EQ(
        LineCategory::MALFORMED,
        getCategory(
            classifier.classify("Player 1 wins with 11 cards in their deck")));
}

TEST(LineClassifierTest, testCardLinesRoundTrip)
{
    for (const auto n : to(N_CARDS)) {
        const auto card = enumerateCard(n);
        for (const auto& record : {
                 LineRecord {FaceUpCardLine {card}},
                 LineRecord {FaceDownCardLine {card}},
                 LineRecord {RoundWinnerLine {1, card}},
             }) {
            EXPECT_EQ(record, classify(renderLine(record)));
        }
    }
}
