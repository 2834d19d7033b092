/** \file
 *
 * \brief Connected numbers of the spicy game mode
 */

#ifndef TRIO_CONNECTIONS_HH_
#define TRIO_CONNECTIONS_HH_

#include <span>

namespace Trio {

/** \brief Return the numbers connected to \p number
 *
 * Each number is connected to the numbers at most two steps away from it:
 * 1 is connected to 2 and 3, 5 to 3, 4, 6 and 7, and so on.
 *
 * \param number a card number
 *
 * \return the connected numbers in ascending order
 *
 * \throw std::out_of_range if \p number is not in range 1-12
 */
std::span<const int> connectedNumbers(int number);

/** \brief Determine if two numbers are connected
 *
 * \return true if \p b is one of connectedNumbers(\p a), false otherwise
 *
 * \throw std::out_of_range if \p a is not a card number
 */
bool numbersConnected(int a, int b);

}

#endif // TRIO_CONNECTIONS_HH_
