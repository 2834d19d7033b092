#include "trio/HandPosition.hh"

#include "IoUtility.hh"

#include <initializer_list>
#include <ostream>

namespace Trio {

namespace {

const auto HAND_POSITION_STRING_PAIRS =
    std::initializer_list<HandPositionToStringMap::value_type> {
    { HandPosition::LOWEST,  "lowest"  },
    { HandPosition::HIGHEST, "highest" },
};

}

const HandPositionToStringMap HAND_POSITION_TO_STRING_MAP(
    HAND_POSITION_STRING_PAIRS.begin(), HAND_POSITION_STRING_PAIRS.end());

std::optional<HandPosition> handPositionFromString(
    const std::string_view position)
{
    const auto& positions = HAND_POSITION_TO_STRING_MAP.right;
    const auto iter = positions.find(std::string {position});
    if (iter == positions.end()) {
        return std::nullopt;
    }
    return iter->second;
}

std::ostream& operator<<(std::ostream& os, const HandPosition position)
{
    return outputEnum(os, position, HAND_POSITION_TO_STRING_MAP.left);
}

}
