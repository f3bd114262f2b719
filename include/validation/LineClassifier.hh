/** \file
 *
 * \brief Definition of WarCheck::Validation::LineClassifier class
 */

#ifndef VALIDATION_LINECLASSIFIER_HH_
#define VALIDATION_LINECLASSIFIER_HH_

#include "war/LineRecord.hh"
#include "war/WarConstants.hh"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace WarCheck {
namespace Validation {

/** \brief Parameters of the line grammar
 */
struct ClassifierConfig {
    /** \brief Player numbers accepted in player, round winner and game
     * winner lines
     */
    std::set<int> playerNumbers {PLAYERS.begin(), PLAYERS.end()};

    /** \brief The maximum card count accepted in game winner lines
     */
    int maxCards {N_CARDS};
};

/** \brief The maximum length of a line the grammar rules are tried on
 *
 * A line that is longer than this after removing surrounding whitespace is
 * malformed. No valid line comes close to the limit.
 */
constexpr auto MAX_LINE_LENGTH = std::size_t {256};

/** \brief Classifier of transcript lines
 *
 * LineClassifier turns raw text into one of the records of LineRecord. The
 * classification is total: text that does not conform to any of the grammar
 * rules is classified as MalformedLine. The classifier is stateless, and the
 * same classifier can be used to classify any number of lines.
 *
 * The grammar rules are, in the priority order they are tried:
 *
 * 1. “Round <int>”
 * 2. “Player <int>:”
 * 3. “- <Rank> of <Suit>”
 * 4. “- <Rank> of <Suit> (face down)”
 * 5. “Round winner: Player <int> (<Rank> of <Suit>)”
 * 6. “Commencing war...”
 * 7. “Round <int>, War <int>”
 * 8. “Continuing war...”
 * 9. “Player <int> wins with <int> cards in their deck”
 * 10. “The game ended in a draw”
 *
 * A rule that matches the text structurally but whose fields are invalid
 * (the number does not fit in an int, the player is not one of the
 * configured players, the rank or suit is not recognized or the card count is
 * out of range) does not classify the line, and the next rule is tried.
 */
class LineClassifier {
public:

    /** \brief Create classifier with the default configuration
     */
    LineClassifier();

    /** \brief Create classifier
     *
     * \param config the grammar parameters
     */
    explicit LineClassifier(ClassifierConfig config);

    /** \brief Classify a line
     *
     * Text containing a newline is malformed. Otherwise surrounding
     * whitespace is ignored, and text containing only whitespace is an empty
     * line. Text longer than MAX_LINE_LENGTH is malformed without trying the
     * grammar rules.
     *
     * \param text the line to classify
     *
     * \return the record corresponding to \p text
     */
    LineRecord classify(std::string_view text) const;

private:

    std::optional<LineRecord> classifyRound(const std::string& line) const;
    std::optional<LineRecord> classifyPlayerLabel(const std::string& line) const;
    std::optional<LineRecord> classifyFaceUpCard(const std::string& line) const;
    std::optional<LineRecord> classifyFaceDownCard(
        const std::string& line) const;
    std::optional<LineRecord> classifyRoundWinner(
        const std::string& line) const;
    std::optional<LineRecord> classifyCommencingWar(
        const std::string& line) const;
    std::optional<LineRecord> classifyWarRound(const std::string& line) const;
    std::optional<LineRecord> classifyContinuingWar(
        const std::string& line) const;
    std::optional<LineRecord> classifyGameWinner(const std::string& line) const;
    std::optional<LineRecord> classifyDraw(const std::string& line) const;

    bool isValidPlayer(int player) const;

    ClassifierConfig config;
};

/** \brief Classify a line using the default grammar parameters
 *
 * \param text the line to classify
 *
 * \return the record corresponding to \p text
 *
 * \sa LineClassifier::classify()
 */
LineRecord classify(std::string_view text);

}
}

#endif // VALIDATION_LINECLASSIFIER_HH_
