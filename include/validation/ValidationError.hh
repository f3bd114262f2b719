/** \file
 *
 * \brief Definition of WarCheck::Validation::ValidationError
 */

#ifndef VALIDATION_VALIDATIONERROR_HH_
#define VALIDATION_VALIDATIONERROR_HH_

#include <iosfwd>
#include <string>

namespace WarCheck {

/** \brief Transcript validation
 *
 * The Validation namespace contains the classifier, state machine and
 * consistency trackers used to validate War transcripts.
 */
namespace Validation {

/** \brief Kind of a validation error
 */
enum class ErrorKind {
    MALFORMED_LINE,    ///< The line does not conform to the grammar
    UNEXPECTED_LINE,   ///< The line is not allowed in the current state
    NUMBERING,         ///< Round or war round number mismatch
    CARD_PROVENANCE,   ///< The card cannot be played by the player
    TRICK_RESOLUTION,  ///< Declared winner or war does not match the cards
    INCOMPLETE,        ///< The transcript ended before the game ended
};

/** \brief Validation error
 *
 * Validation errors are ordinary results of validating an invalid
 * transcript, not exceptional situations. The operations of the validation
 * components return an empty optional on success and a ValidationError
 * describing the first inconsistency otherwise.
 */
struct ValidationError {
    ErrorKind kind;       ///< \brief The kind of the error
    std::string message;  ///< \brief Human readable description

    /// \brief Equality comparison
    bool operator==(const ValidationError&) const = default;
};

/** \brief Output an ErrorKind to stream
 *
 * \param os the output stream
 * \param kind the kind to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, ErrorKind kind);

/** \brief Output a ValidationError to stream
 *
 * \param os the output stream
 * \param error the error to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const ValidationError& error);

}
}

#endif // VALIDATION_VALIDATIONERROR_HH_
