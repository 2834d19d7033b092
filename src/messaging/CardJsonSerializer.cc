#include "messaging/CardJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"
#include "trio/Card.hh"

using nlohmann::json;

namespace Trio {

const std::string CARD_ID_KEY {"id"};
const std::string CARD_NUMBER_KEY {"number"};
const std::string CARD_FACE_UP_KEY {"face_up"};

void to_json(json& j, const Card& card)
{
    j = json::object();
    j.emplace(CARD_ID_KEY, card.getId());
    j.emplace(CARD_NUMBER_KEY, card.getNumber());
    j.emplace(CARD_FACE_UP_KEY, true);
}

json hiddenCardToJson(const Card& card)
{
    return {
        { CARD_ID_KEY, card.getId() },
        { CARD_NUMBER_KEY, nullptr },
        { CARD_FACE_UP_KEY, false },
    };
}

void to_json(json& j, const GameMode mode)
{
    j = Messaging::enumToJson(mode, GAME_MODE_TO_STRING_MAP.left);
}

void to_json(json& j, const HandPosition position)
{
    j = Messaging::enumToJson(position, HAND_POSITION_TO_STRING_MAP.left);
}

}
