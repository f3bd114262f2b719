/** \file
 *
 * \brief Definition of WarCheck::LineRecord variant and related concepts
 *
 * A transcript of a War game consists of lines, each of which is exactly one
 * of the records defined in this file. The streaming operators write the
 * records in their literal transcript form, so that classifying the output of
 * a well formed record yields the record back.
 */

#ifndef LINERECORD_HH_
#define LINERECORD_HH_

#include "war/Card.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <variant>

namespace WarCheck {

/** \brief Round header: “Round <n>”
 */
struct RoundLine {
    int roundNumber;  ///< \brief The round number
    /// \brief Equality comparison
    bool operator==(const RoundLine&) const = default;
};

/** \brief Player label: “Player <n>:”
 */
struct PlayerLabelLine {
    int playerNumber;  ///< \brief The player whose cards follow
    /// \brief Equality comparison
    bool operator==(const PlayerLabelLine&) const = default;
};

/** \brief Face up card: “- <Rank> of <Suit>”
 */
struct FaceUpCardLine {
    Card card;  ///< \brief The card played
    /// \brief Equality comparison
    bool operator==(const FaceUpCardLine&) const = default;
};

/** \brief Face down card: “- <Rank> of <Suit> (face down)”
 */
struct FaceDownCardLine {
    Card card;  ///< \brief The card played
    /// \brief Equality comparison
    bool operator==(const FaceDownCardLine&) const = default;
};

/** \brief Round winner: “Round winner: Player <n> (<Rank> of <Suit>)”
 */
struct RoundWinnerLine {
    int playerNumber;  ///< \brief The player declared winner
    Card card;         ///< \brief The card the winner won with
    /// \brief Equality comparison
    bool operator==(const RoundWinnerLine&) const = default;
};

/** \brief Tag for “Commencing war...”
 */
struct CommencingWarLine {
    /// \brief Equality comparison
    bool operator==(const CommencingWarLine&) const = default;
};

/** \brief War round header: “Round <n>, War <m>”
 */
struct WarRoundLine {
    int roundNumber;     ///< \brief The round number
    int warRoundNumber;  ///< \brief The war round number within the round
    /// \brief Equality comparison
    bool operator==(const WarRoundLine&) const = default;
};

/** \brief Tag for “Continuing war...”
 */
struct ContinuingWarLine {
    /// \brief Equality comparison
    bool operator==(const ContinuingWarLine&) const = default;
};

/** \brief Game winner: “Player <n> wins with <m> cards in their deck”
 */
struct GameWinnerLine {
    int playerNumber;  ///< \brief The player declared winner of the game
    int cardCount;     ///< \brief The declared number of cards of the winner
    /// \brief Equality comparison
    bool operator==(const GameWinnerLine&) const = default;
};

/** \brief Tag for “The game ended in a draw”
 */
struct DrawLine {
    /// \brief Equality comparison
    bool operator==(const DrawLine&) const = default;
};

/** \brief Tag for a line containing only whitespace
 */
struct EmptyLine {
    /// \brief Equality comparison
    bool operator==(const EmptyLine&) const = default;
};

/** \brief Line not conforming to the transcript grammar
 */
struct MalformedLine {
    std::string text;  ///< \brief The offending text
    /// \brief Equality comparison
    bool operator==(const MalformedLine&) const = default;
};

/** \brief Transcript line
 *
 * A variant object representing one classified line of a transcript.
 */
using LineRecord = std::variant<
    RoundLine, PlayerLabelLine, FaceUpCardLine, FaceDownCardLine,
    RoundWinnerLine, CommencingWarLine, WarRoundLine, ContinuingWarLine,
    GameWinnerLine, DrawLine, EmptyLine, MalformedLine>;

/** \brief The alternative held by a LineRecord
 */
enum class LineCategory {
    ROUND,
    PLAYER_LABEL,
    FACE_UP_CARD,
    FACE_DOWN_CARD,
    ROUND_WINNER,
    COMMENCING_WAR,
    WAR_ROUND,
    CONTINUING_WAR,
    GAME_WINNER,
    DRAW,
    EMPTY,
    MALFORMED,
};

/** \brief Determine the category of a record
 *
 * \param record the record
 *
 * \return the category corresponding to the alternative held by \p record
 */
LineCategory getCategory(const LineRecord& record);

/** \brief Determine the player number carried by a record
 *
 * \param record the record
 *
 * \return the player number of a player label, round winner or game winner
 * line, or none for other records
 */
std::optional<int> getPlayerNumber(const LineRecord& record);

/** \brief Render a record in its transcript form
 *
 * \param record the record
 *
 * \return the line as it appears in a transcript
 */
std::string renderLine(const LineRecord& record);

/// \cond DOXYGEN_IGNORE
// These are required to generate proper streaming operator for the variant
// type LineRecord (see IoUtility.hh)
std::ostream& operator<<(std::ostream& os, const RoundLine& line);
std::ostream& operator<<(std::ostream& os, const PlayerLabelLine& line);
std::ostream& operator<<(std::ostream& os, const FaceUpCardLine& line);
std::ostream& operator<<(std::ostream& os, const FaceDownCardLine& line);
std::ostream& operator<<(std::ostream& os, const RoundWinnerLine& line);
std::ostream& operator<<(std::ostream& os, CommencingWarLine);
std::ostream& operator<<(std::ostream& os, const WarRoundLine& line);
std::ostream& operator<<(std::ostream& os, ContinuingWarLine);
std::ostream& operator<<(std::ostream& os, const GameWinnerLine& line);
std::ostream& operator<<(std::ostream& os, DrawLine);
std::ostream& operator<<(std::ostream& os, EmptyLine);
std::ostream& operator<<(std::ostream& os, const MalformedLine& line);
/// \endcond

/** \brief Output a LineCategory to stream
 *
 * \param os the output stream
 * \param category the category to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, LineCategory category);

}

#endif // LINERECORD_HH_
