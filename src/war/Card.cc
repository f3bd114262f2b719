#include "war/Card.hh"

#include "war/WarConstants.hh"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <tuple>

namespace WarCheck {

using namespace std::string_view_literals;

namespace {

constexpr std::array<std::string_view, N_RANKS> RANK_NAMES {
    "Ace"sv, "Two"sv, "Three"sv, "Four"sv, "Five"sv, "Six"sv, "Seven"sv,
    "Eight"sv, "Nine"sv, "Ten"sv, "Jack"sv, "Queen"sv, "King"sv,
};

constexpr std::array<std::string_view, N_SUITS> SUIT_NAMES {
    "Clubs"sv, "Diamonds"sv, "Hearts"sv, "Spades"sv,
};

template<typename Enum, typename Names>
std::string_view getName(const Enum e, const Names& names, const char* what)
{
    const auto n = static_cast<int>(e);
    if (n < 0 || n >= static_cast<int>(names.size())) {
        throw std::invalid_argument {what};
    }
    return names[n];
}

template<typename Enum, typename Names>
std::optional<Enum> fromName(const std::string_view name, const Names& names)
{
    const auto iter = std::find(names.begin(), names.end(), name);
    if (iter == names.end()) {
        return std::nullopt;
    }
    return static_cast<Enum>(iter - names.begin());
}

}

bool operator==(const Card& lhs, const Card& rhs)
{
    return lhs.rank == rhs.rank && lhs.suit == rhs.suit;
}

bool operator<(const Card& lhs, const Card& rhs)
{
    return std::tie(lhs.rank, lhs.suit) < std::tie(rhs.rank, rhs.suit);
}

std::string_view getRankName(const Rank rank)
{
    return getName(rank, RANK_NAMES, "Invalid rank");
}

std::string_view getSuitName(const Suit suit)
{
    return getName(suit, SUIT_NAMES, "Invalid suit");
}

std::optional<Rank> rankFromString(const std::string_view name)
{
    return fromName<Rank>(name, RANK_NAMES);
}

std::optional<Suit> suitFromString(const std::string_view name)
{
    return fromName<Suit>(name, SUIT_NAMES);
}

int cardIndex(const Card& card)
{
    const auto n_suit = static_cast<int>(card.suit);
    const auto n_rank = static_cast<int>(card.rank);
    return n_suit * N_RANKS + n_rank;
}

Card enumerateCard(const int n)
{
    static_assert(N_RANKS * N_SUITS == N_CARDS);
    if (n < 0 || n >= N_CARDS) {
        throw std::invalid_argument {"Invalid card number"};
    }

    const auto n_suit = n / N_RANKS;
    const auto n_rank = n % N_RANKS;
    return {static_cast<Rank>(n_rank), static_cast<Suit>(n_suit)};
}

std::vector<Card> standardDeck()
{
    return std::vector<Card>(cardIterator(0), cardIterator(N_CARDS));
}

std::ostream& operator<<(std::ostream& os, const Rank rank)
{
    return os << getRankName(rank);
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << getSuitName(suit);
}

std::ostream& operator<<(std::ostream& os, const Card& card)
{
    return os << card.rank << " of " << card.suit;
}

}
