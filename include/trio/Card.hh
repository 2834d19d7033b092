/** \file
 *
 * \brief Definition of Trio::Card class
 */

#ifndef TRIO_CARD_HH_
#define TRIO_CARD_HH_

#include <boost/operators.hpp>

#include <iosfwd>

namespace Trio {

/** \brief A card of the Trio deck
 *
 * A card is identified by an id that is unique and stable for the duration
 * of a game. The face of the card is a number between 1 and 12. Two cards are
 * equal only if they have the same id, so the three copies of a number are
 * distinct cards.
 */
class Card : private boost::equality_comparable<Card> {
public:

    /** \brief Create card
     *
     * \param id the id of the card
     * \param number the face value of the card
     *
     * \throw std::invalid_argument if \p id is not in range 0-35 or \p number
     * is not in range 1-12
     */
    Card(int id, int number);

    /** \brief Return the id of the card
     */
    int getId() const noexcept { return id; }

    /** \brief Return the face value of the card
     */
    int getNumber() const noexcept { return number; }

private:

    int id;
    int number;
};

/** \brief Equality operator for cards
 *
 * \return true if \p lhs and \p rhs have the same id
 */
bool operator==(const Card& lhs, const Card& rhs);

/** \brief Output a Card to stream
 *
 * The card is written as its number followed by its id, e.g. “7#19”.
 */
std::ostream& operator<<(std::ostream& os, const Card& card);

}

#endif // TRIO_CARD_HH_
