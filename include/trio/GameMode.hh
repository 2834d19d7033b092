/** \file
 *
 * \brief Definition of Trio::GameMode enum and related utilities
 */

#ifndef TRIO_GAMEMODE_HH_
#define TRIO_GAMEMODE_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace Trio {

/** \brief The rule set deciding how a game is won
 *
 * A trio of sevens wins in both modes.
 */
enum class GameMode {
    SIMPLE,  ///< Three trios win
    SPICY    ///< Two trios of connected numbers win
};

/** \brief Type of \ref GAME_MODE_TO_STRING_MAP
 */
using GameModeToStringMap = boost::bimaps::bimap<GameMode, std::string>;

/** \brief Two‐way map between GameMode enumerations and their string
 * representation
 */
extern const GameModeToStringMap GAME_MODE_TO_STRING_MAP;

/** \brief Parse game mode chosen by a player
 *
 * Any spelling of “spicy” ignoring case selects GameMode::SPICY. Everything
 * else, including unknown names, selects GameMode::SIMPLE.
 *
 * \param mode the mode as given by the client
 *
 * \return the selected game mode
 */
GameMode gameModeFromString(std::string_view mode);

/** \brief Output a GameMode to stream
 */
std::ostream& operator<<(std::ostream& os, GameMode mode);

}

#endif // TRIO_GAMEMODE_HH_
