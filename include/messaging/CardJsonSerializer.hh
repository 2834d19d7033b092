/** \file
 *
 * \brief JSON serializers for cards and the basic enumerations
 */

#ifndef MESSAGING_CARDJSONSERIALIZER_HH_
#define MESSAGING_CARDJSONSERIALIZER_HH_

#include "trio/GameMode.hh"
#include "trio/HandPosition.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Trio {

class Card;

/** \brief Key for Card::getId()
 */
extern const std::string CARD_ID_KEY;

/** \brief Key for Card::getNumber()
 */
extern const std::string CARD_NUMBER_KEY;

/** \brief Key for the visibility of a card
 */
extern const std::string CARD_FACE_UP_KEY;

/** \brief Convert a face up Card to JSON
 *
 * \c {"id": <id>, "number": <number>, "face_up": true}
 */
void to_json(nlohmann::json&, const Card&);

/** \brief Create the JSON view of a face down card
 *
 * \c {"id": <id>, "number": null, "face_up": false}
 */
nlohmann::json hiddenCardToJson(const Card& card);

/** \brief Convert GameMode to JSON string
 */
void to_json(nlohmann::json&, GameMode);

/** \brief Convert HandPosition to JSON string
 */
void to_json(nlohmann::json&, HandPosition);

}

#endif // MESSAGING_CARDJSONSERIALIZER_HH_
