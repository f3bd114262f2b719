/** \file
 *
 * \brief Definition of WarCheck::Card struct and related concepts
 */

#ifndef CARD_HH_
#define CARD_HH_

#include <boost/iterator/counting_iterator.hpp>
#include <boost/iterator/transform_iterator.hpp>
#include <boost/operators.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

namespace WarCheck {

/** \brief Rank of a playing card
 *
 * The enumerators are declared in the order used to compare cards in War:
 * ace is the lowest and king the highest rank.
 */
enum class Rank {
    ACE,
    TWO,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    TEN,
    JACK,
    QUEEN,
    KING,
};

/** \brief Suit of a playing card
 *
 * Suits have no order in War. The enumerators are ordered only to make cards
 * usable as keys of ordered containers.
 */
enum class Suit {
    CLUBS,
    DIAMONDS,
    HEARTS,
    SPADES,
};

/** \brief Number of ranks
 */
constexpr auto N_RANKS = 13;

/** \brief Number of suits
 */
constexpr auto N_SUITS = 4;

/** \brief Array containing all ranks in ascending order
 */
constexpr std::array<Rank, N_RANKS> RANKS {
    Rank::ACE,
    Rank::TWO,
    Rank::THREE,
    Rank::FOUR,
    Rank::FIVE,
    Rank::SIX,
    Rank::SEVEN,
    Rank::EIGHT,
    Rank::NINE,
    Rank::TEN,
    Rank::JACK,
    Rank::QUEEN,
    Rank::KING,
};

/** \brief Array containing all suits
 */
constexpr std::array<Suit, N_SUITS> SUITS {
    Suit::CLUBS,
    Suit::DIAMONDS,
    Suit::HEARTS,
    Suit::SPADES,
};

/** \brief Playing card
 *
 * Card objects are values. They compare equal when both rank and suit are
 * equal. The ordering compares ranks first and suits second, which makes the
 * ordering consistent with the War rank comparison for cards of different
 * rank.
 *
 * \note Boost operators library is used to ensure that the rest of the
 * comparison operators are generated with usual semantics when operator== and
 * operator< are supplied.
 */
struct Card : private boost::totally_ordered<Card> {
    Rank rank;  ///< \brief Rank of the card
    Suit suit;  ///< \brief Suit of the card

    Card() = default;

    /** \brief Create new card
     *
     * \param rank the rank of the card
     * \param suit the suit of the card
     */
    constexpr Card(Rank rank, Suit suit) :
        rank {rank},
        suit {suit}
    {
    }
};

/** \brief Equality operator for cards
 *
 * \sa Card
 */
bool operator==(const Card&, const Card&);

/** \brief Less than operator for cards
 *
 * \sa Card
 */
bool operator<(const Card&, const Card&);

/** \brief Get the name of a rank as it appears in transcripts
 *
 * \param rank the rank
 *
 * \return the capitalized English name of the rank (“Ace”, “Two”, …)
 *
 * \throw std::invalid_argument if \p rank is invalid
 */
std::string_view getRankName(Rank rank);

/** \brief Get the name of a suit as it appears in transcripts
 *
 * \param suit the suit
 *
 * \return the capitalized English name of the suit (“Clubs”, …)
 *
 * \throw std::invalid_argument if \p suit is invalid
 */
std::string_view getSuitName(Suit suit);

/** \brief Convert name to rank
 *
 * The conversion is case sensitive and accepts only the full names returned
 * by getRankName().
 *
 * \param name the name of the rank
 *
 * \return the rank named by \p name, or none if there is no such rank
 */
std::optional<Rank> rankFromString(std::string_view name);

/** \brief Convert name to suit
 *
 * \param name the name of the suit
 *
 * \return the suit named by \p name, or none if there is no such suit
 *
 * \sa rankFromString()
 */
std::optional<Suit> suitFromString(std::string_view name);

/** \brief Convert a card to an integer
 *
 * This function is the inverse of enumerateCard()
 *
 * \param card A card
 *
 * \return An integer \c n such that <tt>enumerateCard(n) == card</tt>
 */
int cardIndex(const Card& card);

/** \brief Convert an integer to a card
 *
 * \param n number between 0 and 51
 *
 * \return card corresponding to the number
 *
 * \throw std::invalid_argument if n is not valid card index
 */
Card enumerateCard(int n);

/** \brief Iterator for iterating over cards
 *
 * Cards are iterated in the same order as returned by enumerateCard().
 *
 * \sa standardDeck()
 */
inline auto cardIterator(int n)
{
    return boost::make_transform_iterator(
        boost::make_counting_iterator(n), enumerateCard);
}

/** \brief Create the standard 52 card deck
 *
 * \return vector containing each card exactly once
 */
std::vector<Card> standardDeck();

/** \brief Output a Rank to stream
 *
 * \param os the output stream
 * \param rank the rank to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Rank rank);

/** \brief Output a Suit to stream
 *
 * \param os the output stream
 * \param suit the suit to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

/** \brief Output a Card to stream
 *
 * The card is written in the transcript form, e.g. “Ace of Spades”.
 *
 * \param os the output stream
 * \param card the card to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Card& card);

}

#endif // CARD_HH_
