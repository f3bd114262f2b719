#include "validation/TranscriptValidator.hh"

#include "war/WarConstants.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace WarCheck {
namespace Validation {

namespace {

template<typename... Ts>
ValidationError makeError(const ErrorKind kind, const Ts&... ts)
{
    std::ostringstream os;
    (os << ... << ts);
    return {kind, os.str()};
}

struct CardCounts {
    const std::map<int, int>& counts;
};

std::ostream& operator<<(std::ostream& os, const CardCounts& cardCounts)
{
    auto first = true;
    for (const auto& [player, count] : cardCounts.counts) {
        if (!first) {
            os << ", ";
        }
        os << "Player " << player << ": " << count;
        first = false;
    }
    return os;
}

struct Players {
    const TrickComparer::PlayerVector& players;
};

std::ostream& operator<<(std::ostream& os, const Players& players)
{
    auto first = true;
    for (const auto player : players.players) {
        if (!first) {
            os << ", ";
        }
        os << "Player " << player;
        first = false;
    }
    return os;
}

std::optional<int> getPlayerInTurn(const ProtocolState state)
{
    switch (state) {
    case ProtocolState::REGULAR_PLAYER_1_CARD:
    case ProtocolState::WAR_PLAYER_1_CARD_UP:
    case ProtocolState::WAR_PLAYER_1_CARD_DOWN:
        return PLAYER_1;
    case ProtocolState::REGULAR_PLAYER_2_CARD:
    case ProtocolState::WAR_PLAYER_2_CARD_UP:
    case ProtocolState::WAR_PLAYER_2_CARD_DOWN:
        return PLAYER_2;
    default:
        return std::nullopt;
    }
}

std::optional<int> getWinner(const std::optional<GameEndOutcome> outcome)
{
    if (outcome == GameEndOutcome::PLAYER_1_WIN) {
        return PLAYER_1;
    } else if (outcome == GameEndOutcome::PLAYER_2_WIN) {
        return PLAYER_2;
    }
    return std::nullopt;
}

}

TranscriptValidator::TranscriptValidator() :
    TranscriptValidator {ClassifierConfig {}}
{
}

TranscriptValidator::TranscriptValidator(ClassifierConfig config) :
    classifier {std::move(config)}
{
}

ValidationResult TranscriptValidator::validate(
    const std::vector<std::string>& lines)
{
    if (used) {
        throw std::logic_error {"Transcript validator already used"};
    }
    used = true;

    auto line_number = 0;
    for (const auto& line : lines) {
        ++line_number;
        if (auto error = validateLine(line)) {
            log(LogLevel::INFO, "Transcript rejected at line %d: %s",
                line_number, *error);
            return {line_number, stateMachine.getState(), std::move(error)};
        }
    }

    const auto n_lines = static_cast<int>(lines.size());
    const auto state = stateMachine.getState();
    if (!concluded) {
        auto error = makeError(
            ErrorKind::INCOMPLETE, "Game did not end; parse state ", state,
            ", war state ", warState, ", game end outcome ", outcome,
            ", cards left ", CardCounts {deckTracker.remainingCounts()});
        log(LogLevel::INFO, "Transcript rejected: %s", error);
        return {n_lines, state, std::move(error)};
    }
    log(LogLevel::INFO, "Transcript of %d lines accepted", n_lines);
    return {n_lines, state, std::nullopt};
}

WarState TranscriptValidator::getWarState() const
{
    return warState;
}

std::optional<GameEndOutcome> TranscriptValidator::getOutcome() const
{
    return outcome;
}

const DeckConsistencyTracker& TranscriptValidator::getDeckTracker() const
{
    return deckTracker;
}

std::optional<ValidationError> TranscriptValidator::validateLine(
    const std::string& line)
{
    const auto record = classifier.classify(line);
    log(LogLevel::DEBUG, "Classified line \"%s\" as %s in state %s",
        line, getCategory(record), stateMachine.getState());

    if (std::holds_alternative<MalformedLine>(record)) {
        return check(std::get<MalformedLine>(record));
    }
    if (!isAcceptable(stateMachine.getState(), getCategory(record))) {
        return unexpectedLine(record);
    }
    auto error = std::visit(
        [this](const auto& alternative) { return check(alternative); },
        record);
    if (error) {
        return error;
    }
    if (!stateMachine.advance(record, warState, outcome)) {
        return unexpectedLine(record);
    }
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(
    const RoundLine& line)
{
    if (line.roundNumber != roundNumber) {
        return makeError(
            ErrorKind::NUMBERING, "Round number should be ", roundNumber,
            "; found line with round number ", line.roundNumber);
    }
    deriveOutcome(0);
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(
    const PlayerLabelLine&)
{
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(
    const FaceUpCardLine& line)
{
    return playCard(line.card, true);
}

std::optional<ValidationError> TranscriptValidator::check(
    const FaceDownCardLine& line)
{
    return playCard(line.card, false);
}

std::optional<ValidationError> TranscriptValidator::check(
    const RoundWinnerLine& line)
{
    const auto winners = trickComparer.getWinners();
    if (!winners) {
        return makeError(
            ErrorKind::TRICK_RESOLUTION, "Player ",
            *trickComparer.getMissingPlayer(), " still has no face up card");
    }
    if (winners->size() != 1) {
        return makeError(
            ErrorKind::TRICK_RESOLUTION, "Multiple winners (",
            Players {*winners}, "), but line says winner is Player ",
            line.playerNumber);
    }
    const auto winner = winners->front();
    if (winner != line.playerNumber) {
        return makeError(
            ErrorKind::TRICK_RESOLUTION, "Player ", winner,
            " won; line says Player ", line.playerNumber);
    }
    const auto winning_card = trickComparer.getFaceUpCard(winner);
    if (winning_card != line.card) {
        return makeError(
            ErrorKind::TRICK_RESOLUTION, "Player ", winner, " won with ",
            *winning_card, "; line says Player ", winner, " won with ",
            line.card);
    }
    if (auto error = deckTracker.collectTrick(winner)) {
        return error;
    }
    trickComparer.reset();
    warState = WarState::NO_WAR;
    ++roundNumber;
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(CommencingWarLine)
{
    if (auto error = checkTie("commence")) {
        return error;
    }
    warRoundNumber = 1;
    warState = WarState::WAR_ONGOING;
    trickComparer.reset();
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(
    const WarRoundLine& line)
{
    if (line.roundNumber != roundNumber) {
        return makeError(
            ErrorKind::NUMBERING, "Round number should be ", roundNumber,
            "; found war round line with round number ", line.roundNumber);
    }
    if (line.warRoundNumber != warRoundNumber) {
        return makeError(
            ErrorKind::NUMBERING, "War round number should be ",
            warRoundNumber, "; found line with war round number ",
            line.warRoundNumber);
    }
    // A war round needs a face up and a face down card from each player
    deriveOutcome(2);
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(ContinuingWarLine)
{
    if (auto error = checkTie("continue")) {
        return error;
    }
    ++warRoundNumber;
    warState = WarState::WAR_ONGOING;
    trickComparer.reset();
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(
    const GameWinnerLine& line)
{
    // The count may include the cards of a war left unresolved when the game
    // ended
    if (getWinner(outcome) == line.playerNumber) {
        const auto n_cards_in_deck =
            deckTracker.remainingCounts().at(line.playerNumber);
        const auto n_cards_in_play =
            static_cast<int>(deckTracker.getCardsInPlay().size());
        if (line.cardCount != n_cards_in_deck &&
            line.cardCount != n_cards_in_deck + n_cards_in_play) {
            return makeError(
                ErrorKind::TRICK_RESOLUTION, "Player ", line.playerNumber,
                " has ", n_cards_in_deck, " cards in their deck; line says ",
                line.cardCount);
        }
    }
    concluded = true;
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(DrawLine)
{
    concluded = true;
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(EmptyLine)
{
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::check(
    const MalformedLine& line)
{
    return makeError(
        ErrorKind::MALFORMED_LINE, "Encountered malformed line: ", line.text);
}

std::optional<ValidationError> TranscriptValidator::playCard(
    const Card& card, const bool faceUp)
{
    const auto player = getPlayerInTurn(stateMachine.getState());
    if (!player) {
        return makeError(
            ErrorKind::UNEXPECTED_LINE, "Cannot play ", card,
            "; no card can be played yet");
    }
    if (auto error = deckTracker.playCard(card, *player)) {
        return error;
    }
    if (faceUp) {
        if (auto error = trickComparer.playFaceUp(card, *player)) {
            return error;
        }
    }

    const auto completes_slot =
        (warState == WarState::NO_WAR && faceUp) ||
        (warState == WarState::WAR_ONGOING && !faceUp);
    if (completes_slot) {
        if (const auto winners = trickComparer.getWinners()) {
            if (winners->size() > 1) {
                warState = (warState == WarState::NO_WAR) ?
                    WarState::WAR_START : WarState::WAR_ONGOING;
            } else {
                warState = (warState == WarState::WAR_ONGOING) ?
                    WarState::WAR_END : WarState::NO_WAR;
            }
            log(LogLevel::DEBUG, "Trick resolved, war state %s", warState);
        }
    }
    return std::nullopt;
}

std::optional<ValidationError> TranscriptValidator::checkTie(
    const char* const action) const
{
    const auto winners = trickComparer.getWinners();
    if (!winners) {
        return makeError(
            ErrorKind::TRICK_RESOLUTION, "Player ",
            *trickComparer.getMissingPlayer(), " still has no face up card");
    }
    if (winners->size() == 1) {
        return makeError(
            ErrorKind::TRICK_RESOLUTION, "Single winner (",
            Players {*winners}, "), but line says war is to ", action);
    }
    return std::nullopt;
}

void TranscriptValidator::deriveOutcome(const int threshold)
{
    if (outcome) {
        return;
    }
    auto remaining = std::vector<int> {};
    for (const auto& [player, count] : deckTracker.remainingCounts()) {
        if (count > threshold) {
            remaining.push_back(player);
        }
    }
    if (remaining.empty()) {
        outcome = GameEndOutcome::DRAW;
    } else if (remaining.size() == 1) {
        outcome = (remaining.front() == PLAYER_1) ?
            GameEndOutcome::PLAYER_1_WIN : GameEndOutcome::PLAYER_2_WIN;
    }
    if (outcome) {
        log(LogLevel::DEBUG, "Game end outcome derived: %s", outcome);
    }
}

ValidationError TranscriptValidator::unexpectedLine(
    const LineRecord& record) const
{
    return makeError(
        ErrorKind::UNEXPECTED_LINE, "Unexpected line \"", record,
        "\" for parse state ", stateMachine.getState(), " with war state ",
        warState, ", game end outcome ", outcome, ", and cards left ",
        CardCounts {deckTracker.remainingCounts()});
}

ValidationResult validateTranscript(
    const std::vector<std::string>& lines, ClassifierConfig config)
{
    auto validator = TranscriptValidator {std::move(config)};
    return validator.validate(lines);
}

std::ostream& operator<<(std::ostream& os, const ValidationResult& result)
{
    if (!result.error) {
        return os << "OK";
    }
    return os << "line " << result.lineNumber << " (" << result.state <<
        "): " << *result.error;
}

}
}
