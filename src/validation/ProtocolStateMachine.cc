#include "validation/ProtocolStateMachine.hh"

#include "war/WarConstants.hh"

#include <algorithm>
#include <array>

namespace WarCheck {
namespace Validation {

namespace {

using S = ProtocolState;
using C = LineCategory;
using W = WarState;
using O = GameEndOutcome;

constexpr auto ANY_PLAYER = std::optional<int> {};
constexpr auto ANY_OUTCOME = std::optional<GameEndOutcome> {};

struct OngoingTransition {
    S from;
    C category;
    W warState;
    std::optional<int> player;
    S to;
};

struct ClosingTransition {
    S from;
    C category;
    std::optional<O> outcome;
    std::optional<int> player;
    S to;
};

constexpr auto ONGOING_TRANSITIONS = std::array {
    OngoingTransition {
        S::REGULAR_ROUND, C::ROUND, W::NO_WAR,
        ANY_PLAYER, S::REGULAR_PLAYER_1_LABEL },
    OngoingTransition {
        S::REGULAR_PLAYER_1_LABEL, C::PLAYER_LABEL, W::NO_WAR,
        PLAYER_1, S::REGULAR_PLAYER_1_CARD },
    OngoingTransition {
        S::REGULAR_PLAYER_1_CARD, C::FACE_UP_CARD, W::NO_WAR,
        ANY_PLAYER, S::REGULAR_PLAYER_2_LABEL },
    OngoingTransition {
        S::REGULAR_PLAYER_2_LABEL, C::PLAYER_LABEL, W::NO_WAR,
        PLAYER_2, S::REGULAR_PLAYER_2_CARD },
    OngoingTransition {
        S::REGULAR_PLAYER_2_CARD, C::FACE_UP_CARD, W::NO_WAR,
        ANY_PLAYER, S::ROUND_WINNER },
    OngoingTransition {
        S::REGULAR_PLAYER_2_CARD, C::FACE_UP_CARD, W::WAR_START,
        ANY_PLAYER, S::COMMENCING_WAR },
    OngoingTransition {
        S::REGULAR_PLAYER_2_CARD, C::FACE_UP_CARD, W::WAR_ONGOING,
        ANY_PLAYER, S::CONTINUING_WAR },
    OngoingTransition {
        S::REGULAR_PLAYER_2_CARD, C::FACE_UP_CARD, W::WAR_END,
        ANY_PLAYER, S::ROUND_WINNER },
    OngoingTransition {
        S::ROUND_WINNER, C::ROUND_WINNER, W::NO_WAR,
        ANY_PLAYER, S::REGULAR_ROUND },
    OngoingTransition {
        S::COMMENCING_WAR, C::COMMENCING_WAR, W::WAR_ONGOING,
        ANY_PLAYER, S::WAR_ROUND },
    OngoingTransition {
        S::WAR_ROUND, C::WAR_ROUND, W::WAR_ONGOING,
        ANY_PLAYER, S::WAR_PLAYER_1_LABEL },
    OngoingTransition {
        S::WAR_PLAYER_1_LABEL, C::PLAYER_LABEL, W::WAR_ONGOING,
        PLAYER_1, S::WAR_PLAYER_1_CARD_UP },
    OngoingTransition {
        S::WAR_PLAYER_1_CARD_UP, C::FACE_UP_CARD, W::WAR_ONGOING,
        ANY_PLAYER, S::WAR_PLAYER_1_CARD_DOWN },
    OngoingTransition {
        S::WAR_PLAYER_1_CARD_DOWN, C::FACE_DOWN_CARD, W::WAR_ONGOING,
        ANY_PLAYER, S::WAR_PLAYER_2_LABEL },
    OngoingTransition {
        S::WAR_PLAYER_2_LABEL, C::PLAYER_LABEL, W::WAR_ONGOING,
        PLAYER_2, S::WAR_PLAYER_2_CARD_UP },
    OngoingTransition {
        S::WAR_PLAYER_2_CARD_UP, C::FACE_UP_CARD, W::WAR_ONGOING,
        ANY_PLAYER, S::WAR_PLAYER_2_CARD_DOWN },
    OngoingTransition {
        S::WAR_PLAYER_2_CARD_DOWN, C::FACE_DOWN_CARD, W::WAR_ONGOING,
        ANY_PLAYER, S::CONTINUING_WAR },
    OngoingTransition {
        S::WAR_PLAYER_2_CARD_DOWN, C::FACE_DOWN_CARD, W::WAR_END,
        ANY_PLAYER, S::ROUND_WINNER },
    OngoingTransition {
        S::CONTINUING_WAR, C::CONTINUING_WAR, W::WAR_ONGOING,
        ANY_PLAYER, S::WAR_ROUND },
};

constexpr auto CLOSING_TRANSITIONS = std::array {
    ClosingTransition {
        S::REGULAR_ROUND, C::ROUND, O::PLAYER_1_WIN,
        ANY_PLAYER, S::WINNER_PLAYER_1 },
    ClosingTransition {
        S::REGULAR_ROUND, C::ROUND, O::PLAYER_2_WIN,
        ANY_PLAYER, S::WINNER_PLAYER_2 },
    ClosingTransition {
        S::REGULAR_ROUND, C::ROUND, O::DRAW,
        ANY_PLAYER, S::DRAW },
    ClosingTransition {
        S::WAR_ROUND, C::WAR_ROUND, O::PLAYER_1_WIN,
        ANY_PLAYER, S::WINNER_PLAYER_1 },
    ClosingTransition {
        S::WAR_ROUND, C::WAR_ROUND, O::PLAYER_2_WIN,
        ANY_PLAYER, S::WINNER_PLAYER_2 },
    ClosingTransition {
        S::WAR_ROUND, C::WAR_ROUND, O::DRAW,
        ANY_PLAYER, S::DRAW },
    ClosingTransition {
        S::WINNER_PLAYER_1, C::GAME_WINNER, ANY_OUTCOME,
        PLAYER_1, S::DONE },
    ClosingTransition {
        S::WINNER_PLAYER_2, C::GAME_WINNER, ANY_OUTCOME,
        PLAYER_2, S::DONE },
    ClosingTransition {
        S::DRAW, C::DRAW, ANY_OUTCOME,
        ANY_PLAYER, S::DONE },
};

bool playerMatches(
    const std::optional<int>& expected, const std::optional<int>& actual)
{
    return !expected || expected == actual;
}

template<typename Transitions, typename Predicate>
std::optional<ProtocolState> findTransition(
    const Transitions& transitions, Predicate&& predicate)
{
    const auto iter = std::find_if(
        transitions.begin(), transitions.end(), predicate);
    if (iter != transitions.end()) {
        return iter->to;
    }
    return std::nullopt;
}

}

std::optional<ProtocolState> nextProtocolState(
    const ProtocolState state, const LineRecord& record,
    const WarState warState, const std::optional<GameEndOutcome> outcome)
{
    const auto category = getCategory(record);
    if (category == C::EMPTY) {
        return state;
    }

    const auto player = getPlayerNumber(record);
    if (outcome) {
        return findTransition(
            CLOSING_TRANSITIONS,
            [&](const auto& transition)
            {
                return transition.from == state &&
                    transition.category == category &&
                    (!transition.outcome || transition.outcome == outcome) &&
                    playerMatches(transition.player, player);
            });
    }
    return findTransition(
        ONGOING_TRANSITIONS,
        [&](const auto& transition)
        {
            return transition.from == state &&
                transition.category == category &&
                transition.warState == warState &&
                playerMatches(transition.player, player);
        });
}

bool isAcceptable(const ProtocolState state, const LineCategory category)
{
    const auto matches = [state, category](const auto& transition)
    {
        return transition.from == state && transition.category == category;
    };
    return category == C::EMPTY ||
        std::any_of(
            ONGOING_TRANSITIONS.begin(), ONGOING_TRANSITIONS.end(), matches) ||
        std::any_of(
            CLOSING_TRANSITIONS.begin(), CLOSING_TRANSITIONS.end(), matches);
}

ProtocolStateMachine::ProtocolStateMachine() :
    ProtocolStateMachine {ProtocolState::REGULAR_ROUND}
{
}

ProtocolStateMachine::ProtocolStateMachine(const ProtocolState initialState) :
    state {initialState}
{
}

std::optional<ProtocolState> ProtocolStateMachine::advance(
    const LineRecord& record, const WarState warState,
    const std::optional<GameEndOutcome> outcome)
{
    const auto next_state = nextProtocolState(state, record, warState, outcome);
    if (next_state) {
        state = *next_state;
    }
    return next_state;
}

ProtocolState ProtocolStateMachine::getState() const
{
    return state;
}

}
}
