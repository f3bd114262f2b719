#include "validation/ValidationError.hh"

#include <map>
#include <ostream>
#include <string_view>

namespace WarCheck {
namespace Validation {

std::ostream& operator<<(std::ostream& os, const ErrorKind kind)
{
    using namespace std::string_view_literals;
    static const std::map<ErrorKind, std::string_view> KIND_NAMES {
        { ErrorKind::MALFORMED_LINE,   "malformed line"sv },
        { ErrorKind::UNEXPECTED_LINE,  "unexpected line"sv },
        { ErrorKind::NUMBERING,        "numbering"sv },
        { ErrorKind::CARD_PROVENANCE,  "card provenance"sv },
        { ErrorKind::TRICK_RESOLUTION, "trick resolution"sv },
        { ErrorKind::INCOMPLETE,       "incomplete"sv },
    };
    return os << KIND_NAMES.at(kind);
}

std::ostream& operator<<(std::ostream& os, const ValidationError& error)
{
    return os << error.message << " [" << error.kind << "]";
}

}
}
