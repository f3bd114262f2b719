/** \file
 *
 * \brief Definition of WarCheck::Validation::TranscriptValidator class
 */

#ifndef VALIDATION_TRANSCRIPTVALIDATOR_HH_
#define VALIDATION_TRANSCRIPTVALIDATOR_HH_

#include "validation/DeckConsistencyTracker.hh"
#include "validation/LineClassifier.hh"
#include "validation/ProtocolStateMachine.hh"
#include "validation/TrickComparer.hh"
#include "validation/ValidationError.hh"
#include "war/LineRecord.hh"
#include "war/ProtocolState.hh"

#include <boost/core/noncopyable.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace WarCheck {
namespace Validation {

/** \brief The verdict of validating a transcript
 */
struct ValidationResult {

    /** \brief The 1-based number of the offending line
     *
     * If the transcript is valid, or ended before the game did, this is the
     * number of lines in the transcript.
     */
    int lineNumber;

    /** \brief The protocol state when validation stopped
     */
    ProtocolState state;

    /** \brief The first error encountered, or none if the transcript is
     * valid
     */
    std::optional<ValidationError> error;

    /// \brief Equality comparison
    bool operator==(const ValidationResult&) const = default;
};

/** \brief Validator of a game transcript
 *
 * TranscriptValidator reads the lines of a transcript in order and checks
 * that each line is well formed, appears where the protocol allows it and is
 * consistent with the cards each player can hold. The first violation stops
 * the validation.
 *
 * An instance validates exactly one transcript.
 */
class TranscriptValidator : private boost::noncopyable {
public:

    /** \brief Create validator using the default grammar parameters
     */
    TranscriptValidator();

    /** \brief Create validator
     *
     * \param config the parameters of the line classifier
     */
    explicit TranscriptValidator(ClassifierConfig config);

    /** \brief Validate transcript
     *
     * \param lines the lines of the transcript, without line terminators
     *
     * \return the verdict
     *
     * \throw std::logic_error if the validator has already been used
     */
    ValidationResult validate(const std::vector<std::string>& lines);

    /** \brief Retrieve the current war state
     */
    WarState getWarState() const;

    /** \brief Retrieve the game end outcome derived so far
     */
    std::optional<GameEndOutcome> getOutcome() const;

    /** \brief Retrieve the card tracker
     */
    const DeckConsistencyTracker& getDeckTracker() const;

private:

    std::optional<ValidationError> validateLine(const std::string& line);

    std::optional<ValidationError> check(const RoundLine& line);
    std::optional<ValidationError> check(const PlayerLabelLine& line);
    std::optional<ValidationError> check(const FaceUpCardLine& line);
    std::optional<ValidationError> check(const FaceDownCardLine& line);
    std::optional<ValidationError> check(const RoundWinnerLine& line);
    std::optional<ValidationError> check(CommencingWarLine line);
    std::optional<ValidationError> check(const WarRoundLine& line);
    std::optional<ValidationError> check(ContinuingWarLine line);
    std::optional<ValidationError> check(const GameWinnerLine& line);
    std::optional<ValidationError> check(DrawLine line);
    std::optional<ValidationError> check(EmptyLine line);
    std::optional<ValidationError> check(const MalformedLine& line);

    std::optional<ValidationError> playCard(const Card& card, bool faceUp);
    std::optional<ValidationError> checkTie(const char* action) const;
    void deriveOutcome(int threshold);
    ValidationError unexpectedLine(const LineRecord& record) const;

    const LineClassifier classifier;
    DeckConsistencyTracker deckTracker;
    TrickComparer trickComparer;
    ProtocolStateMachine stateMachine;
    int roundNumber {1};
    int warRoundNumber {0};
    WarState warState {WarState::NO_WAR};
    std::optional<GameEndOutcome> outcome;
    bool concluded {false};
    bool used {false};
};

/** \brief Validate transcript using a fresh validator
 *
 * \param lines the lines of the transcript
 * \param config the parameters of the line classifier
 *
 * \return the verdict
 */
ValidationResult validateTranscript(
    const std::vector<std::string>& lines, ClassifierConfig config = {});

/** \brief Output ValidationResult to stream
 *
 * A valid transcript is written as “OK”, an invalid one as
 * “line <n> (<state>): <error>”.
 *
 * \param os the output stream
 * \param result the result to write
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const ValidationResult& result);

}
}

#endif // VALIDATION_TRANSCRIPTVALIDATOR_HH_
