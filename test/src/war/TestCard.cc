#include "war/Card.hh"
#include "war/WarConstants.hh"
#include "Utility.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

using WarCheck::Card;
using WarCheck::Rank;
using WarCheck::Suit;

TEST(CardTest, testCardIndex)
{
    for (const auto n : WarCheck::to(WarCheck::N_CARDS)) {
        EXPECT_EQ(n, cardIndex(WarCheck::enumerateCard(n)));
    }
}

TEST(CardTest, testEnumerateCardOutOfRange)
{
    EXPECT_THROW(WarCheck::enumerateCard(-1), std::invalid_argument);
    EXPECT_THROW(
        WarCheck::enumerateCard(WarCheck::N_CARDS), std::invalid_argument);
}

TEST(CardTest, testStandardDeckContainsEachCardOnce)
{
    const auto deck = WarCheck::standardDeck();
    EXPECT_EQ(WarCheck::N_CARDS, static_cast<int>(deck.size()));
    const auto unique_cards = std::set<Card>(deck.begin(), deck.end());
    EXPECT_EQ(deck.size(), unique_cards.size());
}

TEST(CardTest, testAceIsLowestRank)
{
    EXPECT_LT(Rank::ACE, Rank::TWO);
    EXPECT_LT(Rank::QUEEN, Rank::KING);
}

TEST(CardTest, testCardsAreOrderedByRankFirst)
{
    EXPECT_LT(Card(Rank::TWO, Suit::SPADES), Card(Rank::THREE, Suit::CLUBS));
    EXPECT_LT(Card(Rank::TWO, Suit::CLUBS), Card(Rank::TWO, Suit::SPADES));
    EXPECT_NE(Card(Rank::TWO, Suit::CLUBS), Card(Rank::TWO, Suit::SPADES));
}

TEST(CardTest, testRankFromString)
{
    EXPECT_EQ(Rank::ACE, WarCheck::rankFromString("Ace"));
    EXPECT_EQ(Rank::KING, WarCheck::rankFromString("King"));
    EXPECT_FALSE(WarCheck::rankFromString("ace"));
    EXPECT_FALSE(WarCheck::rankFromString("Knight"));
}

TEST(CardTest, testSuitFromString)
{
    EXPECT_EQ(Suit::HEARTS, WarCheck::suitFromString("Hearts"));
    EXPECT_FALSE(WarCheck::suitFromString("Heart"));
}

TEST(CardTest, testInvalidRankName)
{
    EXPECT_THROW(
        WarCheck::getRankName(static_cast<Rank>(WarCheck::N_RANKS)),
        std::invalid_argument);
}

TEST(CardTest, testOutput)
{
    std::ostringstream os;
    os << Card {Rank::QUEEN, Suit::DIAMONDS};
    EXPECT_EQ("Queen of Diamonds", os.str());
}
