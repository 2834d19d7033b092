#include "messaging/RoomJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerJsonSerializer.hh"

#include <variant>

using nlohmann::json;

namespace Trio {
namespace Engine {

const std::string ROOM_ID_KEY {"id"};
const std::string ROOM_NAME_KEY {"name"};
const std::string ROOM_MODE_KEY {"mode"};
const std::string ROOM_PLAYER_COUNT_KEY {"player_count"};
const std::string ROOM_MAX_PLAYERS_KEY {"max_players"};
const std::string ROOM_MIN_PLAYERS_KEY {"min_players"};
const std::string ROOM_STATE_KEY {"state"};
const std::string ROOM_PLAYERS_KEY {"players"};
const std::string ROOM_CURRENT_PLAYER_KEY {"current_player"};
const std::string ROOM_CURRENT_PLAYER_ID_KEY {"current_player_id"};
const std::string ROOM_MIDDLE_CARDS_KEY {"middle_cards"};
const std::string ROOM_MIDDLE_CARD_COUNT_KEY {"middle_card_count"};
const std::string ROOM_REVEALED_KEY {"revealed_this_turn"};
const std::string MIDDLE_TAKEN_KEY {"taken"};
const std::string REVEAL_CARD_KEY {"card"};
const std::string REVEAL_SOURCE_KEY {"source"};
const std::string REVEAL_POSITION_KEY {"position"};
const std::string MIDDLE_SOURCE {"Middle"};

namespace {

void emplaceCurrentPlayer(json& j, const Room& room)
{
    if (const auto* player = room.getCurrentPlayer()) {
        j.emplace(ROOM_CURRENT_PLAYER_KEY, player->getName());
        j.emplace(ROOM_CURRENT_PLAYER_ID_KEY, player->getId());
    } else {
        j.emplace(ROOM_CURRENT_PLAYER_KEY, nullptr);
        j.emplace(ROOM_CURRENT_PLAYER_ID_KEY, nullptr);
    }
}

class RevealOriginToJson {
public:

    RevealOriginToJson(const Room& room, json& j) : room {room}, j {j} {}

    void operator()(const MiddleOrigin&) const
    {
        j.emplace(REVEAL_SOURCE_KEY, MIDDLE_SOURCE);
        j.emplace(REVEAL_POSITION_KEY, nullptr);
    }

    void operator()(const HandOrigin& origin) const
    {
        const auto* player = room.getPlayer(origin.playerId);
        if (player) {
            j.emplace(REVEAL_SOURCE_KEY, player->getName());
        } else {
            j.emplace(REVEAL_SOURCE_KEY, origin.playerId);
        }
        j.emplace(REVEAL_POSITION_KEY, origin.position);
    }

private:
    const Room& room;
    json& j;
};

}

void to_json(json& j, const Phase phase)
{
    j = Messaging::enumToJson(phase, PHASE_TO_STRING_MAP.left);
}

void to_json(json& j, const Room& room)
{
    j = json::object();
    j.emplace(ROOM_ID_KEY, room.getCode());
    j.emplace(ROOM_NAME_KEY, room.getName());
    j.emplace(ROOM_MODE_KEY, room.getMode());
    j.emplace(ROOM_PLAYER_COUNT_KEY, room.getNumberOfPlayers());
    j.emplace(ROOM_MAX_PLAYERS_KEY, room.getMaxPlayers());
    j.emplace(ROOM_MIN_PLAYERS_KEY, room.getMinPlayers());
    j.emplace(ROOM_STATE_KEY, room.getPhase());
    j.emplace(ROOM_PLAYERS_KEY, room.getPlayers());
    emplaceCurrentPlayer(j, room);
}

void to_json(json& j, const MiddleSlot& slot)
{
    const auto face_up = (slot.state == MiddleCardState::FACE_UP);
    j = json::object();
    j.emplace(CARD_ID_KEY, slot.card.getId());
    if (face_up) {
        j.emplace(CARD_NUMBER_KEY, slot.card.getNumber());
    } else {
        j.emplace(CARD_NUMBER_KEY, nullptr);
    }
    j.emplace(CARD_FACE_UP_KEY, face_up);
    j.emplace(MIDDLE_TAKEN_KEY, slot.state == MiddleCardState::TAKEN);
}

json revealEntryToJson(const Room& room, const RevealEntry& entry)
{
    auto j = json::object();
    j.emplace(REVEAL_CARD_KEY, entry.card);
    std::visit(RevealOriginToJson {room, j}, entry.origin);
    return j;
}

json gameStateToJson(const Room& room)
{
    auto revealed = json::array();
    for (const auto& entry : room.getRevealSequence()) {
        revealed.push_back(revealEntryToJson(room, entry));
    }
    auto j = json::object();
    j.emplace(ROOM_PLAYERS_KEY, room.getPlayers());
    j.emplace(ROOM_MIDDLE_CARDS_KEY, room.getMiddle());
    j.emplace(ROOM_MIDDLE_CARD_COUNT_KEY, room.getNumberOfFaceDownCards());
    j.emplace(ROOM_REVEALED_KEY, std::move(revealed));
    emplaceCurrentPlayer(j, room);
    return j;
}

}
}
