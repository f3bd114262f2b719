/** \file
 *
 * \brief Definition of WarCheck::Validation::TrickComparer class
 */

#ifndef VALIDATION_TRICKCOMPARER_HH_
#define VALIDATION_TRICKCOMPARER_HH_

#include "validation/ValidationError.hh"
#include "war/Card.hh"

#include <map>
#include <optional>
#include <vector>

namespace WarCheck {
namespace Validation {

/** \brief Comparer of the face up cards on the table
 *
 * TrickComparer keeps the face up cards played in the current round or war
 * round, and determines the winners once every player has played. The cards
 * are compared by rank only. If several players tie with the highest rank,
 * they are all winners, which means that the trick is resolved by war.
 */
class TrickComparer {
public:

    /** \brief Vector of player numbers
     */
    using PlayerVector = std::vector<int>;

    /** \brief Create comparer for the two players of a standard game
     */
    TrickComparer();

    /** \brief Create comparer
     *
     * \param players the players expected to play to each trick
     */
    explicit TrickComparer(PlayerVector players);

    /** \brief Record a face up card played by a player
     *
     * \param card the card played
     * \param player the player
     *
     * \return error if \p player already has a face up card on the table,
     * none otherwise
     */
    std::optional<ValidationError> playFaceUp(const Card& card, int player);

    /** \brief Retrieve the face up card of a player
     *
     * \return the card played by \p player, or none if the player has not
     * played a face up card since the last reset()
     */
    std::optional<Card> getFaceUpCard(int player) const;

    /** \brief Determine the first player without a face up card
     *
     * \return the first expected player that has not yet played, or none if
     * everyone has played
     */
    std::optional<int> getMissingPlayer() const;

    /** \brief Determine the winners of the trick
     *
     * \return the players, in playing order, whose face up card has the
     * highest rank, or none if some player has not played yet
     */
    std::optional<PlayerVector> getWinners() const;

    /** \brief Clear the face up cards
     */
    void reset();

private:

    const PlayerVector players;
    std::map<int, Card> faceUpCards;
};

}
}

#endif // VALIDATION_TRICKCOMPARER_HH_
