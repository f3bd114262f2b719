/** \file
 *
 * \brief Definition of WarCheck::Validation::CardGroupDeck class
 */

#ifndef VALIDATION_CARDGROUPDECK_HH_
#define VALIDATION_CARDGROUPDECK_HH_

#include "war/Card.hh"

#include <deque>
#include <iosfwd>
#include <set>

namespace WarCheck {
namespace Validation {

/** \brief Deck of a player whose exact order is only partially known
 *
 * A CardGroupDeck is an ordered sequence of card groups. Each group consists
 * of an unordered set of candidate cards and the number of cards the player
 * still draws from the group. A player draws from the first group until the
 * draws from it are exhausted, and only then moves to the next group. This
 * models that the cards of a trick won by a player stay together at the
 * bottom of their deck until the cards above them have been played, while
 * the order within the trick is unknown.
 *
 * A group may have more candidates than draws. This is the case for the
 * initial group when the deal is unknown: each player draws 26 cards from
 * the 52 card pool, and the cards played by the opponent are removed from the
 * candidates with removeCandidate() as the game progresses.
 */
class CardGroupDeck {
public:

    /** \brief Create empty deck
     */
    CardGroupDeck();

    /** \brief Create deck with a single initial group
     *
     * \tparam CardIterator an input iterator returning Card when dereferenced
     *
     * \param first iterator to the first candidate card
     * \param last iterator one past the last candidate card
     * \param nDraws the number of cards the player draws from the group
     *
     * \throw std::invalid_argument if \p nDraws is negative or exceeds the
     * number of candidates
     */
    template<typename CardIterator>
    CardGroupDeck(CardIterator first, CardIterator last, int nDraws);

    /** \brief Determine the number of cards the player still draws
     *
     * \return the sum of the remaining draws of each group
     */
    int getNumberOfCards() const;

    /** \brief Determine the number of groups in the deck
     */
    int getNumberOfGroups() const;

    /** \brief Determine if a card can be drawn next
     *
     * \param card the card
     *
     * \return true if \p card is a candidate in the first group, false
     * otherwise
     */
    bool canDraw(const Card& card) const;

    /** \brief Draw a card from the first group
     *
     * Removes the card from the candidates of the first group and consumes
     * one draw from it. The group is removed when its draws or candidates are
     * exhausted.
     *
     * \param card the card drawn
     *
     * \return true if the card was drawn, false if canDraw(card) is false
     */
    bool draw(const Card& card);

    /** \brief Remove a card from the candidates
     *
     * This is used when the card is known to be somewhere else, e.g. played
     * by another player. Draws are not consumed. A group left without
     * candidates is removed.
     *
     * \param card the card
     *
     * \return true if the card was a candidate in some group, false otherwise
     */
    bool removeCandidate(const Card& card);

    /** \brief Add group to the bottom of the deck
     *
     * All cards of the group are drawn from it, i.e. the number of draws is
     * the number of cards. Adding an empty group does nothing.
     *
     * \tparam CardIterator an input iterator returning Card when dereferenced
     *
     * \param first iterator to the first card
     * \param last iterator one past the last card
     */
    template<typename CardIterator>
    void addGroupToBottom(CardIterator first, CardIterator last);

private:

    struct CardGroup {
        std::set<Card> candidates;
        int nDraws;
    };

    void addGroup(std::set<Card> candidates, int nDraws);
    void removeExhaustedGroups();

    std::deque<CardGroup> groups;

    friend std::ostream& operator<<(std::ostream&, const CardGroupDeck&);
};

/** \brief Output a CardGroupDeck to stream
 *
 * \param os the output stream
 * \param deck the deck to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const CardGroupDeck& deck);

template<typename CardIterator>
CardGroupDeck::CardGroupDeck(
    CardIterator first, CardIterator last, const int nDraws)
{
    addGroup(std::set<Card>(first, last), nDraws);
}

template<typename CardIterator>
void CardGroupDeck::addGroupToBottom(CardIterator first, CardIterator last)
{
    auto candidates = std::set<Card>(first, last);
    const auto n_draws = static_cast<int>(candidates.size());
    addGroup(std::move(candidates), n_draws);
}

}
}

#endif // VALIDATION_CARDGROUPDECK_HH_
