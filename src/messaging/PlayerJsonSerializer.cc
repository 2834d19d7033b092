#include "messaging/PlayerJsonSerializer.hh"

#include "engine/Player.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <vector>

using nlohmann::json;

namespace Trio {
namespace Engine {

const std::string PLAYER_ID_KEY {"id"};
const std::string PLAYER_NAME_KEY {"name"};
const std::string PLAYER_CARD_COUNT_KEY {"card_count"};
const std::string PLAYER_TRIO_COUNT_KEY {"trio_count"};
const std::string PLAYER_TRIOS_KEY {"trios"};
const std::string PLAYER_CONNECTED_KEY {"connected"};
const std::string HAND_CARDS_KEY {"hand"};
const std::string HAND_LOWEST_KEY {"lowest"};
const std::string HAND_HIGHEST_KEY {"highest"};

void to_json(json& j, const Player& player)
{
    auto trios = json::array();
    for (const auto& trio : player.getTrios()) {
        auto numbers = json::array();
        for (const auto& card : trio) {
            numbers.push_back(card.getNumber());
        }
        trios.push_back(std::move(numbers));
    }
    j = json::object();
    j.emplace(PLAYER_ID_KEY, player.getId());
    j.emplace(PLAYER_NAME_KEY, player.getName());
    j.emplace(PLAYER_CARD_COUNT_KEY, player.getNumberOfCards());
    j.emplace(PLAYER_TRIO_COUNT_KEY, player.getNumberOfTrios());
    j.emplace(PLAYER_TRIOS_KEY, std::move(trios));
    j.emplace(PLAYER_CONNECTED_KEY, player.isConnected());
}

json handToJson(const Player& player)
{
    return {
        { HAND_CARDS_KEY, player.getHand() },
        { HAND_LOWEST_KEY, player.getLowestNumber() },
        { HAND_HIGHEST_KEY, player.getHighestNumber() },
    };
}

}
}
