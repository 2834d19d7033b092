/** \file
 *
 * \brief The random number generator shared by the server
 */

#ifndef TRIO_RANDOM_HH_
#define TRIO_RANDOM_HH_

#include <random>

namespace Trio {

/** \brief The random number engine used for shuffling and identifiers
 */
using Rng = std::mt19937;

/** \brief Get reference to the global random number engine
 *
 * The engine is seeded once from \c std::random_device. It is only used from
 * the message loop thread.
 */
Rng& getRng();

}

#endif // TRIO_RANDOM_HH_
