#include "war/LineRecord.hh"

#include "IoUtility.hh"

#include <map>
#include <ostream>
#include <sstream>
#include <string_view>

namespace WarCheck {

namespace {

class LineCategoryVisitor {
public:

    LineCategory operator()(const RoundLine&) const
    {
        return LineCategory::ROUND;
    }

    LineCategory operator()(const PlayerLabelLine&) const
    {
        return LineCategory::PLAYER_LABEL;
    }

    LineCategory operator()(const FaceUpCardLine&) const
    {
        return LineCategory::FACE_UP_CARD;
    }

    LineCategory operator()(const FaceDownCardLine&) const
    {
        return LineCategory::FACE_DOWN_CARD;
    }

    LineCategory operator()(const RoundWinnerLine&) const
    {
        return LineCategory::ROUND_WINNER;
    }

    LineCategory operator()(CommencingWarLine) const
    {
        return LineCategory::COMMENCING_WAR;
    }

    LineCategory operator()(const WarRoundLine&) const
    {
        return LineCategory::WAR_ROUND;
    }

    LineCategory operator()(ContinuingWarLine) const
    {
        return LineCategory::CONTINUING_WAR;
    }

    LineCategory operator()(const GameWinnerLine&) const
    {
        return LineCategory::GAME_WINNER;
    }

    LineCategory operator()(DrawLine) const
    {
        return LineCategory::DRAW;
    }

    LineCategory operator()(EmptyLine) const
    {
        return LineCategory::EMPTY;
    }

    LineCategory operator()(const MalformedLine&) const
    {
        return LineCategory::MALFORMED;
    }
};

class PlayerNumberVisitor {
public:

    std::optional<int> operator()(const PlayerLabelLine& line) const
    {
        return line.playerNumber;
    }

    std::optional<int> operator()(const RoundWinnerLine& line) const
    {
        return line.playerNumber;
    }

    std::optional<int> operator()(const GameWinnerLine& line) const
    {
        return line.playerNumber;
    }

    template<typename Line>
    std::optional<int> operator()(const Line&) const
    {
        return std::nullopt;
    }
};

}

LineCategory getCategory(const LineRecord& record)
{
    return std::visit(LineCategoryVisitor {}, record);
}

std::optional<int> getPlayerNumber(const LineRecord& record)
{
    return std::visit(PlayerNumberVisitor {}, record);
}

std::string renderLine(const LineRecord& record)
{
    std::ostringstream os;
    os << record;
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const RoundLine& line)
{
    return os << "Round " << line.roundNumber;
}

std::ostream& operator<<(std::ostream& os, const PlayerLabelLine& line)
{
    return os << "Player " << line.playerNumber << ":";
}

std::ostream& operator<<(std::ostream& os, const FaceUpCardLine& line)
{
    return os << "- " << line.card;
}

std::ostream& operator<<(std::ostream& os, const FaceDownCardLine& line)
{
    return os << "- " << line.card << " (face down)";
}

std::ostream& operator<<(std::ostream& os, const RoundWinnerLine& line)
{
    return os << "Round winner: Player " << line.playerNumber << " (" <<
        line.card << ")";
}

std::ostream& operator<<(std::ostream& os, CommencingWarLine)
{
    return os << "Commencing war...";
}

std::ostream& operator<<(std::ostream& os, const WarRoundLine& line)
{
    return os << "Round " << line.roundNumber << ", War " <<
        line.warRoundNumber;
}

std::ostream& operator<<(std::ostream& os, ContinuingWarLine)
{
    return os << "Continuing war...";
}

std::ostream& operator<<(std::ostream& os, const GameWinnerLine& line)
{
    return os << "Player " << line.playerNumber << " wins with " <<
        line.cardCount << " cards in their deck";
}

std::ostream& operator<<(std::ostream& os, DrawLine)
{
    return os << "The game ended in a draw";
}

std::ostream& operator<<(std::ostream& os, EmptyLine)
{
    return os;
}

std::ostream& operator<<(std::ostream& os, const MalformedLine& line)
{
    return os << line.text;
}

std::ostream& operator<<(std::ostream& os, const LineCategory category)
{
    using namespace std::string_view_literals;
    static const std::map<LineCategory, std::string_view> CATEGORY_NAMES {
        { LineCategory::ROUND,          "round"sv },
        { LineCategory::PLAYER_LABEL,   "player label"sv },
        { LineCategory::FACE_UP_CARD,   "face up card"sv },
        { LineCategory::FACE_DOWN_CARD, "face down card"sv },
        { LineCategory::ROUND_WINNER,   "round winner"sv },
        { LineCategory::COMMENCING_WAR, "commencing war"sv },
        { LineCategory::WAR_ROUND,      "war round"sv },
        { LineCategory::CONTINUING_WAR, "continuing war"sv },
        { LineCategory::GAME_WINNER,    "game winner"sv },
        { LineCategory::DRAW,           "draw"sv },
        { LineCategory::EMPTY,          "empty"sv },
        { LineCategory::MALFORMED,      "malformed"sv },
    };
    return os << CATEGORY_NAMES.at(category);
}

}
