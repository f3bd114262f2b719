#include "validation/LineClassifier.hh"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <array>
#include <regex>
#include <utility>

namespace WarCheck {
namespace Validation {

namespace {

const auto ROUND_REGEX = std::regex {"Round (\\d+)"};
const auto PLAYER_LABEL_REGEX = std::regex {"Player (\\d+):"};
const auto FACE_UP_CARD_REGEX = std::regex {"- ([A-Za-z]+) of ([A-Za-z]+)"};
const auto FACE_DOWN_CARD_REGEX = std::regex {
    "- ([A-Za-z]+) of ([A-Za-z]+) \\(face down\\)"};
const auto ROUND_WINNER_REGEX = std::regex {
    "Round winner: Player (\\d+) \\(([A-Za-z]+) of ([A-Za-z]+)\\)"};
const auto COMMENCING_WAR_REGEX = std::regex {"Commencing war\\.\\.\\."};
const auto WAR_ROUND_REGEX = std::regex {"Round (\\d+), War (\\d+)"};
const auto CONTINUING_WAR_REGEX = std::regex {"Continuing war\\.\\.\\."};
const auto GAME_WINNER_REGEX = std::regex {
    "Player (\\d+) wins with (\\d+) cards in their deck"};
const auto DRAW_REGEX = std::regex {"The game ended in a draw"};

std::optional<int> toInt(const std::ssub_match& match)
{
    auto ret = 0;
    if (boost::conversion::try_lexical_convert(match.str(), ret)) {
        return ret;
    }
    return std::nullopt;
}

std::optional<Card> toCard(
    const std::ssub_match& rankMatch, const std::ssub_match& suitMatch)
{
    const auto rank = rankFromString(rankMatch.str());
    const auto suit = suitFromString(suitMatch.str());
    if (rank && suit) {
        return Card {*rank, *suit};
    }
    return std::nullopt;
}

}

LineClassifier::LineClassifier() = default;

LineClassifier::LineClassifier(ClassifierConfig config) :
    config {std::move(config)}
{
}

LineRecord LineClassifier::classify(const std::string_view text) const
{
    using ClassifyFunction =
        std::optional<LineRecord> (LineClassifier::*)(const std::string&) const;
    static constexpr std::array<ClassifyFunction, 10> RULES {
        &LineClassifier::classifyRound,
        &LineClassifier::classifyPlayerLabel,
        &LineClassifier::classifyFaceUpCard,
        &LineClassifier::classifyFaceDownCard,
        &LineClassifier::classifyRoundWinner,
        &LineClassifier::classifyCommencingWar,
        &LineClassifier::classifyWarRound,
        &LineClassifier::classifyContinuingWar,
        &LineClassifier::classifyGameWinner,
        &LineClassifier::classifyDraw,
    };

    auto original = std::string {text};
    if (original.find('\n') != std::string::npos) {
        return MalformedLine {std::move(original)};
    }

    const auto line = boost::algorithm::trim_copy(original);
    if (line.empty()) {
        return EmptyLine {};
    }
    // std::regex_match recurses on the length of its input
    if (line.size() > MAX_LINE_LENGTH) {
        return MalformedLine {std::move(original)};
    }

    for (const auto rule : RULES) {
        if (auto record = (this->*rule)(line)) {
            return std::move(*record);
        }
    }
    return MalformedLine {std::move(original)};
}

std::optional<LineRecord> LineClassifier::classifyRound(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, ROUND_REGEX)) {
        if (const auto round_number = toInt(match[1])) {
            return RoundLine {*round_number};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyPlayerLabel(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, PLAYER_LABEL_REGEX)) {
        const auto player = toInt(match[1]);
        if (player && isValidPlayer(*player)) {
            return PlayerLabelLine {*player};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyFaceUpCard(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, FACE_UP_CARD_REGEX)) {
        if (const auto card = toCard(match[1], match[2])) {
            return FaceUpCardLine {*card};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyFaceDownCard(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, FACE_DOWN_CARD_REGEX)) {
        if (const auto card = toCard(match[1], match[2])) {
            return FaceDownCardLine {*card};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyRoundWinner(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, ROUND_WINNER_REGEX)) {
        const auto player = toInt(match[1]);
        const auto card = toCard(match[2], match[3]);
        if (player && isValidPlayer(*player) && card) {
            return RoundWinnerLine {*player, *card};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyCommencingWar(
    const std::string& line) const
{
    if (std::regex_match(line, COMMENCING_WAR_REGEX)) {
        return CommencingWarLine {};
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyWarRound(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, WAR_ROUND_REGEX)) {
        const auto round_number = toInt(match[1]);
        const auto war_round_number = toInt(match[2]);
        if (round_number && war_round_number) {
            return WarRoundLine {*round_number, *war_round_number};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyContinuingWar(
    const std::string& line) const
{
    if (std::regex_match(line, CONTINUING_WAR_REGEX)) {
        return ContinuingWarLine {};
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyGameWinner(
    const std::string& line) const
{
    auto match = std::smatch {};
    if (std::regex_match(line, match, GAME_WINNER_REGEX)) {
        const auto player = toInt(match[1]);
        const auto card_count = toInt(match[2]);
        if (player && isValidPlayer(*player) && card_count &&
            0 <= *card_count && *card_count <= config.maxCards) {
            return GameWinnerLine {*player, *card_count};
        }
    }
    return std::nullopt;
}

std::optional<LineRecord> LineClassifier::classifyDraw(
    const std::string& line) const
{
    if (std::regex_match(line, DRAW_REGEX)) {
        return DrawLine {};
    }
    return std::nullopt;
}

bool LineClassifier::isValidPlayer(const int player) const
{
    return config.playerNumbers.contains(player);
}

LineRecord classify(const std::string_view text)
{
    static const auto classifier = LineClassifier {};
    return classifier.classify(text);
}

}
}
