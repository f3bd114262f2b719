/** \file
 *
 * \brief Definition of WarCheck::Validation::DeckConsistencyTracker class
 */

#ifndef VALIDATION_DECKCONSISTENCYTRACKER_HH_
#define VALIDATION_DECKCONSISTENCYTRACKER_HH_

#include "validation/CardGroupDeck.hh"
#include "validation/ValidationError.hh"
#include "war/Card.hh"

#include <boost/core/noncopyable.hpp>

#include <map>
#include <optional>
#include <set>

namespace WarCheck {
namespace Validation {

/** \brief Tracker of the provenance of the cards played in a game
 *
 * The actual order of the cards in the decks of the players is initially
 * unknown. DeckConsistencyTracker ensures that the sequence of cards played
 * by each player is consistent: a card is played at most once before it is
 * collected back, only by a player who may possess it, and only when the
 * player has reached the group of cards containing it.
 *
 * Each of the 52 cards is at any time either a candidate in the deck of some
 * player or in play. Cards collected by a player are recorded as owned by
 * that player, and a played card is removed from the owner map until it is
 * collected again. The sum of remaining cards and cards in play is always
 * 52.
 */
class DeckConsistencyTracker : private boost::noncopyable {
public:

    /** \brief Create tracker for a standard two player game
     *
     * Both players start with 26 cards drawn from the unknown 52 card deal.
     */
    DeckConsistencyTracker();

    /** \brief Play a card from the deck of a player
     *
     * The play fails if
     *   - the card is owned by another player
     *   - the card is not in the first card group of the deck of the player
     *   - the card is already in play
     *
     * \param card the card played
     * \param player the player playing the card
     *
     * \return error describing the failed check, or none if the card was
     * played
     *
     * \throw std::out_of_range if \p player is not a valid player
     */
    std::optional<ValidationError> playCard(const Card& card, int player);

    /** \brief Collect the cards in play to the deck of a player
     *
     * The cards are added as a new group to the bottom of the deck of \p
     * player, who becomes their owner.
     *
     * \param player the player collecting the trick
     *
     * \return error if some card in play is still owned by a player, or none
     * if the trick was collected
     *
     * \throw std::out_of_range if \p player is not a valid player
     */
    std::optional<ValidationError> collectTrick(int player);

    /** \brief Retrieve the number of cards each player has left
     *
     * \return map from player number to the number of cards in their deck,
     * not counting cards in play
     */
    std::map<int, int> remainingCounts() const;

    /** \brief Retrieve the cards currently in play
     */
    const std::set<Card>& getCardsInPlay() const;

    /** \brief Retrieve the deck of a player
     *
     * \throw std::out_of_range if \p player is not a valid player
     */
    const CardGroupDeck& getDeck(int player) const;

private:

    std::map<Card, int> owners;
    std::set<Card> cardsInPlay;
    std::map<int, CardGroupDeck> decks;
    std::map<int, int> cardCounts;
};

}
}

#endif // VALIDATION_DECKCONSISTENCYTRACKER_HH_
