/** \file
 *
 * \brief JSON serializers for the public views of a room
 */

#ifndef MESSAGING_ROOMJSONSERIALIZER_HH_
#define MESSAGING_ROOMJSONSERIALIZER_HH_

#include "engine/Room.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Trio {
namespace Engine {

/** \brief Key for Room::getCode()
 */
extern const std::string ROOM_ID_KEY;

/** \brief Key for Room::getName()
 */
extern const std::string ROOM_NAME_KEY;

/** \brief Key for Room::getMode()
 */
extern const std::string ROOM_MODE_KEY;

/** \brief Key for Room::getNumberOfPlayers()
 */
extern const std::string ROOM_PLAYER_COUNT_KEY;

/** \brief Key for Room::getMaxPlayers()
 */
extern const std::string ROOM_MAX_PLAYERS_KEY;

/** \brief Key for Room::getMinPlayers()
 */
extern const std::string ROOM_MIN_PLAYERS_KEY;

/** \brief Key for Room::getPhase()
 */
extern const std::string ROOM_STATE_KEY;

/** \brief Key for Room::getPlayers()
 */
extern const std::string ROOM_PLAYERS_KEY;

/** \brief Key for the name of Room::getCurrentPlayer()
 */
extern const std::string ROOM_CURRENT_PLAYER_KEY;

/** \brief Key for the id of Room::getCurrentPlayer()
 */
extern const std::string ROOM_CURRENT_PLAYER_ID_KEY;

/** \brief Key for Room::getMiddle()
 */
extern const std::string ROOM_MIDDLE_CARDS_KEY;

/** \brief Key for Room::getNumberOfFaceDownCards()
 */
extern const std::string ROOM_MIDDLE_CARD_COUNT_KEY;

/** \brief Key for Room::getRevealSequence()
 */
extern const std::string ROOM_REVEALED_KEY;

/** \brief Key for taken middle slots
 */
extern const std::string MIDDLE_TAKEN_KEY;

/** \brief Key for the card of a reveal entry
 */
extern const std::string REVEAL_CARD_KEY;

/** \brief Key for the origin of a reveal entry
 */
extern const std::string REVEAL_SOURCE_KEY;

/** \brief Key for the hand position of a reveal entry
 */
extern const std::string REVEAL_POSITION_KEY;

/** \brief The source label of the cards revealed from the middle
 */
extern const std::string MIDDLE_SOURCE;

/** \brief Convert Phase to JSON string
 */
void to_json(nlohmann::json&, Phase);

/** \brief Convert Room to its public JSON view
 */
void to_json(nlohmann::json&, const Room&);

/** \brief Convert MiddleSlot to JSON
 *
 * The number is only visible when the card is face up. A taken slot keeps
 * its id but shows neither the number nor the face.
 */
void to_json(nlohmann::json&, const MiddleSlot&);

/** \brief Create the JSON view of a reveal entry
 *
 * \param room the room the entry belongs to, used for resolving the name of
 * the player the card was revealed from
 * \param entry the reveal entry
 *
 * \return object with the card, the source label (“Middle” or the player
 * name) and the hand position (null for middle cards)
 */
nlohmann::json revealEntryToJson(const Room& room, const RevealEntry& entry);

/** \brief Create the parameters of the game state event
 *
 * The players, the middle, the number of face down cards, the current reveal
 * sequence and the player having the turn.
 */
nlohmann::json gameStateToJson(const Room& room);

}
}

#endif // MESSAGING_ROOMJSONSERIALIZER_HH_
