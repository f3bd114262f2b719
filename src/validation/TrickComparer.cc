#include "validation/TrickComparer.hh"

#include "war/WarConstants.hh"

#include <algorithm>
#include <sstream>
#include <utility>

namespace WarCheck {
namespace Validation {

TrickComparer::TrickComparer() :
    TrickComparer(PlayerVector(PLAYERS.begin(), PLAYERS.end()))
{
}

TrickComparer::TrickComparer(PlayerVector players) :
    players(std::move(players))
{
}

std::optional<ValidationError> TrickComparer::playFaceUp(
    const Card& card, const int player)
{
    const auto [iter, inserted] = faceUpCards.try_emplace(player, card);
    if (!inserted) {
        std::ostringstream os;
        os << "Player " << player << " tried to play face up card " << card <<
            ", but already has face up card " << iter->second << " in play";
        return ValidationError {ErrorKind::TRICK_RESOLUTION, os.str()};
    }
    return std::nullopt;
}

std::optional<Card> TrickComparer::getFaceUpCard(const int player) const
{
    const auto iter = faceUpCards.find(player);
    if (iter != faceUpCards.end()) {
        return iter->second;
    }
    return std::nullopt;
}

std::optional<int> TrickComparer::getMissingPlayer() const
{
    const auto iter = std::find_if(
        players.begin(), players.end(),
        [this](const auto player) { return !faceUpCards.contains(player); });
    if (iter != players.end()) {
        return *iter;
    }
    return std::nullopt;
}

std::optional<TrickComparer::PlayerVector> TrickComparer::getWinners() const
{
    if (getMissingPlayer()) {
        return std::nullopt;
    }

    auto winners = PlayerVector {};
    auto best_rank = std::optional<Rank> {};
    for (const auto player : players) {
        const auto rank = faceUpCards.at(player).rank;
        if (!best_rank || rank > *best_rank) {
            winners.clear();
            best_rank = rank;
        }
        if (rank == *best_rank) {
            winners.push_back(player);
        }
    }
    return winners;
}

void TrickComparer::reset()
{
    faceUpCards.clear();
}

}
}
