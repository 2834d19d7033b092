#include "trio/GameMode.hh"

#include <boost/algorithm/string/predicate.hpp>

#include "IoUtility.hh"

#include <initializer_list>
#include <ostream>

namespace Trio {

namespace {

const auto GAME_MODE_STRING_PAIRS =
    std::initializer_list<GameModeToStringMap::value_type> {
    { GameMode::SIMPLE, "simple" },
    { GameMode::SPICY,  "spicy"  },
};

}

const GameModeToStringMap GAME_MODE_TO_STRING_MAP(
    GAME_MODE_STRING_PAIRS.begin(), GAME_MODE_STRING_PAIRS.end());

GameMode gameModeFromString(const std::string_view mode)
{
    return boost::algorithm::iequals(mode, "spicy") ?
        GameMode::SPICY : GameMode::SIMPLE;
}

std::ostream& operator<<(std::ostream& os, const GameMode mode)
{
    return outputEnum(os, mode, GAME_MODE_TO_STRING_MAP.left);
}

}
