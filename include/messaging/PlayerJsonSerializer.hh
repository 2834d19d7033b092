/** \file
 *
 * \brief JSON serializers for the public and private views of a player
 */

#ifndef MESSAGING_PLAYERJSONSERIALIZER_HH_
#define MESSAGING_PLAYERJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Trio {
namespace Engine {

class Player;

/** \brief Key for Player::getId()
 */
extern const std::string PLAYER_ID_KEY;

/** \brief Key for Player::getName()
 */
extern const std::string PLAYER_NAME_KEY;

/** \brief Key for Player::getNumberOfCards()
 */
extern const std::string PLAYER_CARD_COUNT_KEY;

/** \brief Key for Player::getNumberOfTrios()
 */
extern const std::string PLAYER_TRIO_COUNT_KEY;

/** \brief Key for the numbers of Player::getTrios()
 */
extern const std::string PLAYER_TRIOS_KEY;

/** \brief Key for Player::isConnected()
 */
extern const std::string PLAYER_CONNECTED_KEY;

/** \brief Key for the cards in the private view
 */
extern const std::string HAND_CARDS_KEY;

/** \brief Key for Player::getLowestNumber()
 */
extern const std::string HAND_LOWEST_KEY;

/** \brief Key for Player::getHighestNumber()
 */
extern const std::string HAND_HIGHEST_KEY;

/** \brief Convert Player to its public JSON view
 *
 * The view contains the id, the name, the number of cards and trios, the
 * numbers of the trios and whether the player is connected. The cards in the
 * hand are not included.
 */
void to_json(nlohmann::json&, const Player&);

/** \brief Create the private JSON view of the hand of \p player
 *
 * The view contains the cards in sorted order and the lowest and highest
 * numbers, which are null for an empty hand.
 */
nlohmann::json handToJson(const Player& player);

}
}

#endif // MESSAGING_PLAYERJSONSERIALIZER_HH_
