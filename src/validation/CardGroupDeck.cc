#include "validation/CardGroupDeck.hh"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <stdexcept>

namespace WarCheck {
namespace Validation {

CardGroupDeck::CardGroupDeck() = default;

int CardGroupDeck::getNumberOfCards() const
{
    return std::accumulate(
        groups.begin(), groups.end(), 0,
        [](const auto sum, const auto& group) { return sum + group.nDraws; });
}

int CardGroupDeck::getNumberOfGroups() const
{
    return static_cast<int>(groups.size());
}

bool CardGroupDeck::canDraw(const Card& card) const
{
    return !groups.empty() && groups.front().candidates.contains(card);
}

bool CardGroupDeck::draw(const Card& card)
{
    if (!canDraw(card)) {
        return false;
    }
    auto& group = groups.front();
    group.candidates.erase(card);
    --group.nDraws;
    removeExhaustedGroups();
    return true;
}

bool CardGroupDeck::removeCandidate(const Card& card)
{
    const auto iter = std::find_if(
        groups.begin(), groups.end(),
        [&card](const auto& group) { return group.candidates.contains(card); });
    if (iter == groups.end()) {
        return false;
    }
    iter->candidates.erase(card);
    if (iter->candidates.empty()) {
        groups.erase(iter);
    }
    return true;
}

void CardGroupDeck::addGroup(std::set<Card> candidates, const int nDraws)
{
    if (nDraws < 0 || nDraws > static_cast<int>(candidates.size())) {
        throw std::invalid_argument {"Invalid number of draws"};
    }
    if (nDraws > 0) {
        groups.emplace_back(CardGroup {std::move(candidates), nDraws});
    }
}

void CardGroupDeck::removeExhaustedGroups()
{
    while (!groups.empty() &&
           (groups.front().nDraws == 0 || groups.front().candidates.empty())) {
        groups.pop_front();
    }
}

std::ostream& operator<<(std::ostream& os, const CardGroupDeck& deck)
{
    os << "[";
    auto first_group = true;
    for (const auto& group : deck.groups) {
        if (!first_group) {
            os << ", ";
        }
        first_group = false;
        os << group.nDraws << " of {";
        auto first_card = true;
        for (const auto& card : group.candidates) {
            if (!first_card) {
                os << ", ";
            }
            first_card = false;
            os << card;
        }
        os << "}";
    }
    return os << "]";
}

}
}
