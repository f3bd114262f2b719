/** \file
 *
 * \brief Definition of WarCheck::Validation::ProtocolStateMachine class
 */

#ifndef VALIDATION_PROTOCOLSTATEMACHINE_HH_
#define VALIDATION_PROTOCOLSTATEMACHINE_HH_

#include "war/LineRecord.hh"
#include "war/ProtocolState.hh"

#include <optional>

namespace WarCheck {
namespace Validation {

/** \brief Determine the next protocol state
 *
 * The transition is looked up from explicit transition tables. Empty lines
 * are ignored and loop back to \p state. If \p outcome is present, the game
 * is ending and only the closing table is consulted: the next round or war
 * round header leads to the state announcing the outcome, which must be
 * followed by the matching game winner or draw line. Otherwise the table of
 * the ongoing game is consulted with the category of \p record and \p
 * warState. Player label and winner lines also need to name the player
 * expected by the table entry.
 *
 * \param state the current state
 * \param record the line record
 * \param warState the war sub‐phase after applying \p record
 * \param outcome the derived game end outcome, if any
 *
 * \return the next state, or none if there is no transition for the
 * combination
 */
std::optional<ProtocolState> nextProtocolState(
    ProtocolState state, const LineRecord& record, WarState warState,
    std::optional<GameEndOutcome> outcome);

/** \brief Determine if a line category is ever acceptable in a state
 *
 * \param state the current state
 * \param category the line category
 *
 * \return true if some war state, outcome and player number allow a record
 * of \p category in \p state, false otherwise
 */
bool isAcceptable(ProtocolState state, LineCategory category);

/** \brief Protocol state machine of a War transcript
 *
 * ProtocolStateMachine determines, given the current state and the next
 * line, the next state using nextProtocolState(). The state machine starts
 * at ProtocolState::REGULAR_ROUND and only moves when the transition is
 * legal.
 */
class ProtocolStateMachine {
public:

    /** \brief Create state machine in the initial state
     */
    ProtocolStateMachine();

    /** \brief Create state machine
     *
     * \param initialState the initial state
     */
    explicit ProtocolStateMachine(ProtocolState initialState);

    /** \brief Advance the state machine
     *
     * \param record the line record
     * \param warState the war sub‐phase after applying \p record
     * \param outcome the derived game end outcome, if any
     *
     * \return the new state, or none if the line is illegal in the current
     * state, in which case the state is not changed
     */
    std::optional<ProtocolState> advance(
        const LineRecord& record, WarState warState,
        std::optional<GameEndOutcome> outcome);

    /** \brief Retrieve the current state
     */
    ProtocolState getState() const;

private:

    ProtocolState state;
};

}
}

#endif // VALIDATION_PROTOCOLSTATEMACHINE_HH_
