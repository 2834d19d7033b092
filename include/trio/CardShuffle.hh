/** \file
 *
 * \brief Utilities for creating the deck
 */

#ifndef TRIO_CARDSHUFFLE_HH_
#define TRIO_CARDSHUFFLE_HH_

#include "trio/Card.hh"

#include <vector>

namespace Trio {

/** \brief Generate the deck in number order
 *
 * \return Vector of the 36 cards. The ids are assigned in number order, three
 * consecutive ids for each number.
 */
std::vector<Card> generateDeck();

/** \brief Generate a uniformly shuffled deck
 *
 * \return generateDeck() shuffled with the global random number engine
 */
std::vector<Card> generateShuffledDeck();

}

#endif // TRIO_CARDSHUFFLE_HH_
