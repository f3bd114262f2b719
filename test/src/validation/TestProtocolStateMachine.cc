#include "validation/ProtocolStateMachine.hh"

#include <gtest/gtest.h>

#include <optional>
#include <tuple>

using namespace WarCheck;
using Validation::isAcceptable;
using Validation::nextProtocolState;
using Validation::ProtocolStateMachine;

namespace {

constexpr auto CARD = Card {Rank::FIVE, Suit::CLUBS};
constexpr auto NO_OUTCOME = std::optional<GameEndOutcome> {};

using OngoingTransitionParam =
    std::tuple<ProtocolState, LineRecord, WarState, ProtocolState>;

}

class OngoingTransitionTest :
    public testing::TestWithParam<OngoingTransitionParam> {};

TEST_P(OngoingTransitionTest, testTransition)
{
    const auto& [from, record, war_state, to] = GetParam();
    EXPECT_EQ(to, nextProtocolState(from, record, war_state, NO_OUTCOME));
}

INSTANTIATE_TEST_SUITE_P(
    RegularRound, OngoingTransitionTest,
    testing::Values(
        OngoingTransitionParam {
            ProtocolState::REGULAR_ROUND, RoundLine {1}, WarState::NO_WAR,
            ProtocolState::REGULAR_PLAYER_1_LABEL },
        OngoingTransitionParam {
            ProtocolState::REGULAR_PLAYER_1_LABEL, PlayerLabelLine {1},
            WarState::NO_WAR, ProtocolState::REGULAR_PLAYER_1_CARD },
        OngoingTransitionParam {
            ProtocolState::REGULAR_PLAYER_1_CARD, FaceUpCardLine {CARD},
            WarState::NO_WAR, ProtocolState::REGULAR_PLAYER_2_LABEL },
        OngoingTransitionParam {
            ProtocolState::REGULAR_PLAYER_2_LABEL, PlayerLabelLine {2},
            WarState::NO_WAR, ProtocolState::REGULAR_PLAYER_2_CARD },
        OngoingTransitionParam {
            ProtocolState::REGULAR_PLAYER_2_CARD, FaceUpCardLine {CARD},
            WarState::NO_WAR, ProtocolState::ROUND_WINNER },
        OngoingTransitionParam {
            ProtocolState::REGULAR_PLAYER_2_CARD, FaceUpCardLine {CARD},
            WarState::WAR_START, ProtocolState::COMMENCING_WAR },
        OngoingTransitionParam {
            ProtocolState::ROUND_WINNER, RoundWinnerLine {1, CARD},
            WarState::NO_WAR, ProtocolState::REGULAR_ROUND }));

INSTANTIATE_TEST_SUITE_P(
    WarRound, OngoingTransitionTest,
    testing::Values(
        OngoingTransitionParam {
            ProtocolState::COMMENCING_WAR, CommencingWarLine {},
            WarState::WAR_ONGOING, ProtocolState::WAR_ROUND },
        OngoingTransitionParam {
            ProtocolState::WAR_ROUND, WarRoundLine {1, 1},
            WarState::WAR_ONGOING, ProtocolState::WAR_PLAYER_1_LABEL },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_1_LABEL, PlayerLabelLine {1},
            WarState::WAR_ONGOING, ProtocolState::WAR_PLAYER_1_CARD_UP },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_1_CARD_UP, FaceUpCardLine {CARD},
            WarState::WAR_ONGOING, ProtocolState::WAR_PLAYER_1_CARD_DOWN },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_1_CARD_DOWN, FaceDownCardLine {CARD},
            WarState::WAR_ONGOING, ProtocolState::WAR_PLAYER_2_LABEL },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_2_LABEL, PlayerLabelLine {2},
            WarState::WAR_ONGOING, ProtocolState::WAR_PLAYER_2_CARD_UP },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_2_CARD_UP, FaceUpCardLine {CARD},
            WarState::WAR_ONGOING, ProtocolState::WAR_PLAYER_2_CARD_DOWN },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_2_CARD_DOWN, FaceDownCardLine {CARD},
            WarState::WAR_ONGOING, ProtocolState::CONTINUING_WAR },
        OngoingTransitionParam {
            ProtocolState::WAR_PLAYER_2_CARD_DOWN, FaceDownCardLine {CARD},
            WarState::WAR_END, ProtocolState::ROUND_WINNER },
        OngoingTransitionParam {
            ProtocolState::CONTINUING_WAR, ContinuingWarLine {},
            WarState::WAR_ONGOING, ProtocolState::WAR_ROUND }));

TEST(ProtocolStateMachineTest, testWrongPlayerLabelIsIllegal)
{
    EXPECT_FALSE(
        nextProtocolState(
            ProtocolState::REGULAR_PLAYER_1_LABEL, PlayerLabelLine {2},
            WarState::NO_WAR, NO_OUTCOME));
}

TEST(ProtocolStateMachineTest, testWrongWarStateIsIllegal)
{
    EXPECT_FALSE(
        nextProtocolState(
            ProtocolState::ROUND_WINNER, RoundWinnerLine {1, CARD},
            WarState::WAR_START, NO_OUTCOME));
}

TEST(ProtocolStateMachineTest, testEmptyLineSelfLoops)
{
    EXPECT_EQ(
        ProtocolState::WAR_PLAYER_1_CARD_DOWN,
        nextProtocolState(
            ProtocolState::WAR_PLAYER_1_CARD_DOWN, EmptyLine {},
            WarState::WAR_ONGOING, NO_OUTCOME));
    EXPECT_EQ(
        ProtocolState::DONE,
        nextProtocolState(
            ProtocolState::DONE, EmptyLine {}, WarState::NO_WAR,
            GameEndOutcome::DRAW));
}

TEST(ProtocolStateMachineTest, testClosingRoundLeadsToWinner)
{
    EXPECT_EQ(
        ProtocolState::WINNER_PLAYER_2,
        nextProtocolState(
            ProtocolState::REGULAR_ROUND, RoundLine {30}, WarState::NO_WAR,
            GameEndOutcome::PLAYER_2_WIN));
    EXPECT_EQ(
        ProtocolState::DRAW,
        nextProtocolState(
            ProtocolState::WAR_ROUND, WarRoundLine {30, 2},
            WarState::WAR_ONGOING, GameEndOutcome::DRAW));
}

TEST(ProtocolStateMachineTest, testGameWinnerMustMatchOutcome)
{
    EXPECT_EQ(
        ProtocolState::DONE,
        nextProtocolState(
            ProtocolState::WINNER_PLAYER_1, GameWinnerLine {1, 52},
            WarState::NO_WAR, GameEndOutcome::PLAYER_1_WIN));
    EXPECT_FALSE(
        nextProtocolState(
            ProtocolState::WINNER_PLAYER_1, GameWinnerLine {2, 52},
            WarState::NO_WAR, GameEndOutcome::PLAYER_1_WIN));
    EXPECT_FALSE(
        nextProtocolState(
            ProtocolState::DRAW, GameWinnerLine {1, 52},
            WarState::NO_WAR, GameEndOutcome::DRAW));
}

TEST(ProtocolStateMachineTest, testOngoingRowsDoNotApplyAfterOutcome)
{
    EXPECT_FALSE(
        nextProtocolState(
            ProtocolState::REGULAR_PLAYER_1_LABEL, PlayerLabelLine {1},
            WarState::NO_WAR, GameEndOutcome::PLAYER_1_WIN));
}

TEST(ProtocolStateMachineTest, testNothingFollowsDone)
{
    EXPECT_FALSE(
        nextProtocolState(
            ProtocolState::DONE, DrawLine {}, WarState::NO_WAR,
            GameEndOutcome::DRAW));
}

TEST(ProtocolStateMachineTest, testIsAcceptable)
{
    EXPECT_TRUE(
        isAcceptable(ProtocolState::REGULAR_ROUND, LineCategory::ROUND));
    EXPECT_TRUE(
        isAcceptable(ProtocolState::COMMENCING_WAR, LineCategory::EMPTY));
    EXPECT_TRUE(
        isAcceptable(ProtocolState::WINNER_PLAYER_2, LineCategory::GAME_WINNER));
    EXPECT_FALSE(
        isAcceptable(
            ProtocolState::COMMENCING_WAR, LineCategory::ROUND_WINNER));
    EXPECT_FALSE(
        isAcceptable(ProtocolState::REGULAR_ROUND, LineCategory::MALFORMED));
}

TEST(ProtocolStateMachineTest, testAdvance)
{
    auto machine = ProtocolStateMachine {};
    EXPECT_EQ(ProtocolState::REGULAR_ROUND, machine.getState());
    EXPECT_EQ(
        ProtocolState::REGULAR_PLAYER_1_LABEL,
        machine.advance(RoundLine {1}, WarState::NO_WAR, NO_OUTCOME));
    EXPECT_EQ(ProtocolState::REGULAR_PLAYER_1_LABEL, machine.getState());
}

TEST(ProtocolStateMachineTest, testIllegalAdvanceKeepsState)
{
    auto machine = ProtocolStateMachine {ProtocolState::COMMENCING_WAR};
    EXPECT_FALSE(
        machine.advance(
            RoundWinnerLine {1, CARD}, WarState::NO_WAR, NO_OUTCOME));
    EXPECT_EQ(ProtocolState::COMMENCING_WAR, machine.getState());
}
