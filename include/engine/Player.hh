/** \file
 *
 * \brief Definition of Trio::Engine::Player class
 */

#ifndef ENGINE_PLAYER_HH_
#define ENGINE_PLAYER_HH_

#include "trio/Card.hh"
#include "trio/HandPosition.hh"
#include "trio/TrioConstants.hh"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace Trio {
namespace Engine {

/** \brief Three cards of the same number captured by a player
 */
using CardTrio = std::array<Card, N_COPIES>;

/** \brief A seat in a room
 *
 * Player holds the hand and the captured trios of one participant. The hand
 * is always sorted by number, so that the lowest card is the first and the
 * highest card the last one.
 *
 * A card taken from the hand during a reveal sequence belongs to neither
 * the hand nor the trios until it is returned with returnCard() or captured
 * into a trio.
 */
class Player {
public:

    /** \brief Create player with empty hand
     *
     * \param id the player id unique within the room
     * \param name the display name
     */
    Player(std::string id, std::string name);

    /** \brief Return the player id
     */
    const std::string& getId() const { return id; }

    /** \brief Return the display name
     */
    const std::string& getName() const { return name; }

    /** \brief Return the cards in hand, lowest first
     */
    const std::vector<Card>& getHand() const { return hand; }

    /** \brief Return the captured trios in capture order
     */
    const std::vector<CardTrio>& getTrios() const { return trios; }

    /** \brief Return the numbers of the captured trios in capture order
     */
    std::vector<int> getTrioNumbers() const;

    /** \brief Return the number of cards in hand
     */
    int getNumberOfCards() const;

    /** \brief Return the number of captured trios
     */
    int getNumberOfTrios() const;

    /** \brief Return the number of the lowest card, or none if the hand is
     * empty
     */
    std::optional<int> getLowestNumber() const;

    /** \brief Return the number of the highest card, or none if the hand is
     * empty
     */
    std::optional<int> getHighestNumber() const;

    /** \brief Determine if the connection of the player is alive
     */
    bool isConnected() const { return connected; }

    /** \brief Set the connection status
     */
    void setConnected(bool connected);

    /** \brief Replace the hand with dealt cards
     *
     * The trios are cleared and \p cards are sorted.
     */
    void deal(std::vector<Card> cards);

    /** \brief Take the lowest or highest card from hand
     *
     * \param position which end of the hand the card is taken from
     *
     * \return the card, or none if the hand is empty
     */
    std::optional<Card> takeCard(HandPosition position);

    /** \brief Put a card back to hand
     *
     * The hand is sorted again after inserting \p card.
     */
    void returnCard(const Card& card);

    /** \brief Add captured trio
     *
     * \throw std::invalid_argument if the cards of \p trio do not share the
     * same number
     */
    void addTrio(const CardTrio& trio);

private:

    void sortHand();

    std::string id;
    std::string name;
    std::vector<Card> hand;
    std::vector<CardTrio> trios;
    bool connected {true};
};

}
}

#endif // ENGINE_PLAYER_HH_
