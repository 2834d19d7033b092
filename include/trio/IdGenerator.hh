/** \file
 *
 * \brief Generators for room codes and player ids
 */

#ifndef TRIO_IDGENERATOR_HH_
#define TRIO_IDGENERATOR_HH_

#include <string>

namespace Trio {

/** \brief Generate a room code
 *
 * \return Five characters drawn uniformly from A-Z and 0-9
 */
std::string generateRoomCode();

/** \brief Generate a player id
 *
 * \return Eight characters drawn uniformly from a-z and 0-9
 */
std::string generatePlayerId();

}

#endif // TRIO_IDGENERATOR_HH_
