/** \file
 *
 * \brief Definition of Trio::HandPosition enum
 */

#ifndef TRIO_HANDPOSITION_HH_
#define TRIO_HANDPOSITION_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace Trio {

/** \brief End of a sorted hand a card is revealed from
 *
 * Only the lowest and the highest card of a hand can be asked for.
 */
enum class HandPosition {
    LOWEST,
    HIGHEST
};

/** \brief Type of \ref HAND_POSITION_TO_STRING_MAP
 */
using HandPositionToStringMap = boost::bimaps::bimap<HandPosition, std::string>;

/** \brief Two‐way map between HandPosition enumerations and their string
 * representation
 */
extern const HandPositionToStringMap HAND_POSITION_TO_STRING_MAP;

/** \brief Parse hand position
 *
 * \param position “lowest” or “highest”
 *
 * \return the hand position, or none if \p position is neither
 */
std::optional<HandPosition> handPositionFromString(std::string_view position);

/** \brief Output a HandPosition to stream
 */
std::ostream& operator<<(std::ostream& os, HandPosition position);

}

#endif // TRIO_HANDPOSITION_HH_
