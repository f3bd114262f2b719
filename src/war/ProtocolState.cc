#include "war/ProtocolState.hh"

#include <map>
#include <ostream>
#include <string_view>

namespace WarCheck {

using namespace std::string_view_literals;

std::ostream& operator<<(std::ostream& os, const ProtocolState state)
{
    static const std::map<ProtocolState, std::string_view> STATE_NAMES {
        { ProtocolState::REGULAR_ROUND,          "REGULAR_ROUND"sv },
        { ProtocolState::REGULAR_PLAYER_1_LABEL, "REGULAR_PLAYER_1_LABEL"sv },
        { ProtocolState::REGULAR_PLAYER_1_CARD,  "REGULAR_PLAYER_1_CARD"sv },
        { ProtocolState::REGULAR_PLAYER_2_LABEL, "REGULAR_PLAYER_2_LABEL"sv },
        { ProtocolState::REGULAR_PLAYER_2_CARD,  "REGULAR_PLAYER_2_CARD"sv },
        { ProtocolState::ROUND_WINNER,           "ROUND_WINNER"sv },
        { ProtocolState::COMMENCING_WAR,         "COMMENCING_WAR"sv },
        { ProtocolState::WAR_ROUND,              "WAR_ROUND"sv },
        { ProtocolState::WAR_PLAYER_1_LABEL,     "WAR_PLAYER_1_LABEL"sv },
        { ProtocolState::WAR_PLAYER_1_CARD_UP,   "WAR_PLAYER_1_CARD_UP"sv },
        { ProtocolState::WAR_PLAYER_1_CARD_DOWN, "WAR_PLAYER_1_CARD_DOWN"sv },
        { ProtocolState::WAR_PLAYER_2_LABEL,     "WAR_PLAYER_2_LABEL"sv },
        { ProtocolState::WAR_PLAYER_2_CARD_UP,   "WAR_PLAYER_2_CARD_UP"sv },
        { ProtocolState::WAR_PLAYER_2_CARD_DOWN, "WAR_PLAYER_2_CARD_DOWN"sv },
        { ProtocolState::CONTINUING_WAR,         "CONTINUING_WAR"sv },
        { ProtocolState::WINNER_PLAYER_1,        "WINNER_PLAYER_1"sv },
        { ProtocolState::WINNER_PLAYER_2,        "WINNER_PLAYER_2"sv },
        { ProtocolState::DRAW,                   "DRAW"sv },
        { ProtocolState::DONE,                   "DONE"sv },
    };
    return os << STATE_NAMES.at(state);
}

std::ostream& operator<<(std::ostream& os, const WarState state)
{
    static const std::map<WarState, std::string_view> STATE_NAMES {
        { WarState::NO_WAR,      "NO_WAR"sv },
        { WarState::WAR_START,   "WAR_START"sv },
        { WarState::WAR_ONGOING, "WAR_ONGOING"sv },
        { WarState::WAR_END,     "WAR_END"sv },
    };
    return os << STATE_NAMES.at(state);
}

std::ostream& operator<<(std::ostream& os, const GameEndOutcome outcome)
{
    static const std::map<GameEndOutcome, std::string_view> OUTCOME_NAMES {
        { GameEndOutcome::PLAYER_1_WIN, "PLAYER_1_WIN"sv },
        { GameEndOutcome::PLAYER_2_WIN, "PLAYER_2_WIN"sv },
        { GameEndOutcome::DRAW,         "DRAW"sv },
    };
    return os << OUTCOME_NAMES.at(outcome);
}

}
