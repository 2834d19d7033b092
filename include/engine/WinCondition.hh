/** \file
 *
 * \brief Win conditions of the game modes
 */

#ifndef ENGINE_WINCONDITION_HH_
#define ENGINE_WINCONDITION_HH_

#include "trio/GameMode.hh"

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

namespace Trio {
namespace Engine {

class Player;

/** \brief The reason a game was won
 */
enum class WinReason {
    SEVEN_TRIO,      ///< A trio of sevens, in any mode
    THREE_TRIOS,     ///< Three trios in the simple mode
    CONNECTED_TRIOS  ///< Two trios of connected numbers in the spicy mode
};

/** \brief Type of \ref WIN_REASON_TO_STRING_MAP
 */
using WinReasonToStringMap = boost::bimaps::bimap<WinReason, std::string>;

/** \brief Two‐way map between WinReason enumerations and their string
 * representation
 */
extern const WinReasonToStringMap WIN_REASON_TO_STRING_MAP;

/** \brief Description of a won game
 */
struct Win {
    WinReason reason;  ///< The winning condition met

    /** \brief The connected pair of trio numbers
     *
     * Only present for WinReason::CONNECTED_TRIOS.
     */
    std::optional<std::pair<int, int>> connected;
};

/** \brief Equality operator for wins
 */
bool operator==(const Win& lhs, const Win& rhs);

/** \brief Check if a player has won
 *
 * The trio of sevens is checked first. In the simple mode three trios win. In
 * the spicy mode two trios win if any pair of the trio numbers is connected.
 * The pairs are tried in capture order, and the first connected pair is
 * reported.
 *
 * \param player the player who just captured a trio
 * \param mode the game mode of the room
 *
 * \return the win, or none if \p player has not won
 */
std::optional<Win> checkWin(const Player& player, GameMode mode);

/** \brief Human readable explanation of a win
 *
 * \return e.g. “Collected 3 trios!”
 */
std::string describeWin(const Win& win);

/** \brief Output a WinReason to stream
 */
std::ostream& operator<<(std::ostream& os, WinReason reason);

/** \brief Output a Win to stream
 */
std::ostream& operator<<(std::ostream& os, const Win& win);

}
}

#endif // ENGINE_WINCONDITION_HH_
