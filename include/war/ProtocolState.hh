/** \file
 *
 * \brief Definition of transcript protocol states and game phases
 */

#ifndef PROTOCOLSTATE_HH_
#define PROTOCOLSTATE_HH_

#include <iosfwd>

namespace WarCheck {

/** \brief State of the transcript protocol
 *
 * The state names the line that is expected next. For example
 * ProtocolState::REGULAR_ROUND means that the line “Round <n>” is expected.
 */
enum class ProtocolState {
    REGULAR_ROUND,
    REGULAR_PLAYER_1_LABEL,
    REGULAR_PLAYER_1_CARD,
    REGULAR_PLAYER_2_LABEL,
    REGULAR_PLAYER_2_CARD,
    ROUND_WINNER,
    COMMENCING_WAR,
    WAR_ROUND,
    WAR_PLAYER_1_LABEL,
    WAR_PLAYER_1_CARD_UP,
    WAR_PLAYER_1_CARD_DOWN,
    WAR_PLAYER_2_LABEL,
    WAR_PLAYER_2_CARD_UP,
    WAR_PLAYER_2_CARD_DOWN,
    CONTINUING_WAR,
    WINNER_PLAYER_1,
    WINNER_PLAYER_2,
    DRAW,
    DONE,
};

/** \brief War sub‐phase derived from the outcome of the latest trick
 */
enum class WarState {
    NO_WAR,       ///< The latest trick had a single winner, no war
    WAR_START,    ///< The regular round tied and a war is about to commence
    WAR_ONGOING,  ///< A war is in progress
    WAR_END,      ///< The latest war round had a single winner
};

/** \brief Outcome of the game derived from the remaining card counts
 */
enum class GameEndOutcome {
    PLAYER_1_WIN,
    PLAYER_2_WIN,
    DRAW,
};

/** \brief Output a ProtocolState to stream
 *
 * \param os the output stream
 * \param state the state to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, ProtocolState state);

/** \brief Output a WarState to stream
 *
 * \param os the output stream
 * \param state the state to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, WarState state);

/** \brief Output a GameEndOutcome to stream
 *
 * \param os the output stream
 * \param outcome the outcome to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, GameEndOutcome outcome);

}

#endif // PROTOCOLSTATE_HH_
