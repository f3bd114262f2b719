#include "validation/DeckConsistencyTracker.hh"

#include "war/WarConstants.hh"

#include <sstream>

namespace WarCheck {
namespace Validation {

namespace {

template<typename... Ts>
ValidationError provenanceError(const Ts&... ts)
{
    std::ostringstream os;
    (os << ... << ts);
    return {ErrorKind::CARD_PROVENANCE, os.str()};
}

}

DeckConsistencyTracker::DeckConsistencyTracker()
{
    const auto deal = standardDeck();
    for (const auto player : PLAYERS) {
        decks.try_emplace(
            player, deal.begin(), deal.end(), N_CARDS_PER_PLAYER);
        cardCounts.emplace(player, N_CARDS_PER_PLAYER);
    }
}

std::optional<ValidationError> DeckConsistencyTracker::playCard(
    const Card& card, const int player)
{
    auto& deck = decks.at(player);

    const auto owner_iter = owners.find(card);
    if (owner_iter != owners.end() && owner_iter->second != player) {
        return provenanceError(card, " is not in deck of Player ", player);
    }
    if (!deck.canDraw(card)) {
        return provenanceError(
            card, " is not in topmost card group of deck of Player ", player);
    }
    if (cardsInPlay.contains(card)) {
        return provenanceError(card, " is already in play");
    }

    if (owner_iter != owners.end()) {
        owners.erase(owner_iter);
    }
    cardsInPlay.insert(card);
    --cardCounts.at(player);
    deck.draw(card);
    for (auto& [other_player, other_deck] : decks) {
        if (other_player != player) {
            other_deck.removeCandidate(card);
        }
    }
    return std::nullopt;
}

std::optional<ValidationError> DeckConsistencyTracker::collectTrick(
    const int player)
{
    auto& deck = decks.at(player);
    for (const auto& card : cardsInPlay) {
        const auto owner_iter = owners.find(card);
        if (owner_iter != owners.end()) {
            return provenanceError(
                card, " to be taken by Player ", player,
                " is not in play but owned by Player ", owner_iter->second);
        }
    }

    deck.addGroupToBottom(cardsInPlay.begin(), cardsInPlay.end());
    for (const auto& card : cardsInPlay) {
        owners.emplace(card, player);
    }
    cardCounts.at(player) += static_cast<int>(cardsInPlay.size());
    cardsInPlay.clear();
    return std::nullopt;
}

std::map<int, int> DeckConsistencyTracker::remainingCounts() const
{
    return cardCounts;
}

const std::set<Card>& DeckConsistencyTracker::getCardsInPlay() const
{
    return cardsInPlay;
}

const CardGroupDeck& DeckConsistencyTracker::getDeck(const int player) const
{
    return decks.at(player);
}

}
}
