#include "engine/Player.hh"
#include "engine/Room.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerJsonSerializer.hh"
#include "messaging/RoomJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"
#include "trio/Card.hh"
#include "trio/CardShuffle.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

using namespace Trio;
using namespace Trio::BlobLiterals;
using Messaging::JsonSerializer;
using Messaging::SerializationFailureException;

using nlohmann::json;

TEST(JsonSerializerTest, testSerializeString)
{
    EXPECT_EQ("\"ABCDE\"", JsonSerializer::serialize(std::string {"ABCDE"}));
}

TEST(JsonSerializerTest, testSerializeEmptyOptional)
{
    EXPECT_EQ("null", JsonSerializer::serialize(std::optional<std::string> {}));
}

TEST(JsonSerializerTest, testDeserializeInteger)
{
    EXPECT_EQ(27, JsonSerializer::deserialize<int>("27"_BS));
}

TEST(JsonSerializerTest, testDeserializeOptional)
{
    EXPECT_EQ(
        std::optional<std::string> {"spicy"},
        JsonSerializer::deserialize<std::optional<std::string>>(
            "\"spicy\""_BS));
    EXPECT_EQ(
        std::nullopt,
        JsonSerializer::deserialize<std::optional<std::string>>("null"_BS));
}

TEST(JsonSerializerTest, testDeserializeWrongType)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<int>("\"lowest\""_BS),
        SerializationFailureException);
}

TEST(JsonSerializerTest, testDeserializeInvalidDocument)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<std::string>("{\"room\":"_BS),
        SerializationFailureException);
}

TEST(CardJsonSerializerTest, testFaceUpCard)
{
    const auto j = json(Card {27, 10});
    EXPECT_EQ(
        (json {{"id", 27}, {"number", 10}, {"face_up", true}}), j);
}

TEST(CardJsonSerializerTest, testHiddenCard)
{
    const auto j = hiddenCardToJson(Card {27, 10});
    EXPECT_EQ(
        (json {{"id", 27}, {"number", nullptr}, {"face_up", false}}), j);
}

TEST(CardJsonSerializerTest, testEnumerations)
{
    EXPECT_EQ(json("spicy"), json(GameMode::SPICY));
    EXPECT_EQ(json("simple"), json(GameMode::SIMPLE));
    EXPECT_EQ(json("lowest"), json(HandPosition::LOWEST));
    EXPECT_EQ(json("highest"), json(HandPosition::HIGHEST));
}

class PlayerJsonSerializerTest : public testing::Test {
protected:
    Engine::Player player {"abcd1234", "Alice"};
};

TEST_F(PlayerJsonSerializerTest, testPublicView)
{
    player.deal({Card {0, 1}, Card {1, 1}, Card {2, 2}});
    player.addTrio({Card {3, 5}, Card {4, 5}, Card {5, 5}});
    const auto j = json(player);
    EXPECT_EQ("abcd1234", j.at("id"));
    EXPECT_EQ("Alice", j.at("name"));
    EXPECT_EQ(3, j.at("card_count"));
    EXPECT_EQ(1, j.at("trio_count"));
    EXPECT_EQ(json::array({json::array({5, 5, 5})}), j.at("trios"));
    EXPECT_EQ(true, j.at("connected"));
    EXPECT_FALSE(j.contains("hand"));
}

TEST_F(PlayerJsonSerializerTest, testPrivateView)
{
    player.deal({Card {2, 2}, Card {0, 1}});
    const auto j = Engine::handToJson(player);
    ASSERT_EQ(2u, j.at("hand").size());
    EXPECT_EQ(1, j.at("hand")[0].at("number"));
    EXPECT_EQ(1, j.at("lowest"));
    EXPECT_EQ(2, j.at("highest"));
}

TEST_F(PlayerJsonSerializerTest, testPrivateViewOfEmptyHand)
{
    const auto j = Engine::handToJson(player);
    EXPECT_TRUE(j.at("hand").empty());
    EXPECT_TRUE(j.at("lowest").is_null());
    EXPECT_TRUE(j.at("highest").is_null());
}

class RoomJsonSerializerTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        room.join("p1", "Alice");
        room.join("p2", "Bob");
        room.join("p3", "Carol");
    }

    Engine::Room room {"ABCDE", "Friday game", GameMode::SIMPLE};
};

TEST_F(RoomJsonSerializerTest, testWaitingRoom)
{
    const auto j = json(room);
    EXPECT_EQ("ABCDE", j.at("id"));
    EXPECT_EQ("Friday game", j.at("name"));
    EXPECT_EQ("simple", j.at("mode"));
    EXPECT_EQ(3, j.at("player_count"));
    EXPECT_EQ(6, j.at("max_players"));
    EXPECT_EQ(3, j.at("min_players"));
    EXPECT_EQ("waiting", j.at("state"));
    EXPECT_EQ(3u, j.at("players").size());
    EXPECT_TRUE(j.at("current_player").is_null());
    EXPECT_TRUE(j.at("current_player_id").is_null());
}

TEST_F(RoomJsonSerializerTest, testGameStateHidesMiddleCards)
{
    room.start(generateDeck());
    const auto j = Engine::gameStateToJson(room);
    const auto& middle = j.at("middle_cards");
    ASSERT_EQ(9u, middle.size());
    EXPECT_EQ(27, middle[0].at("id"));
    EXPECT_TRUE(middle[0].at("number").is_null());
    EXPECT_EQ(false, middle[0].at("face_up"));
    EXPECT_EQ(false, middle[0].at("taken"));
    EXPECT_EQ(9, j.at("middle_card_count"));
    EXPECT_TRUE(j.at("revealed_this_turn").empty());
    const auto* current = room.getCurrentPlayer();
    ASSERT_NE(nullptr, current);
    EXPECT_EQ(current->getId(), j.at("current_player_id"));
}

TEST_F(RoomJsonSerializerTest, testRevealEntryFromMiddle)
{
    const auto entry = Engine::RevealEntry {
        Card {27, 10}, Engine::MiddleOrigin {0}};
    const auto j = Engine::revealEntryToJson(room, entry);
    EXPECT_EQ(10, j.at("card").at("number"));
    EXPECT_EQ("Middle", j.at("source"));
    EXPECT_TRUE(j.at("position").is_null());
}

TEST_F(RoomJsonSerializerTest, testRevealEntryFromHand)
{
    const auto entry = Engine::RevealEntry {
        Card {4, 2}, Engine::HandOrigin {"p2", HandPosition::HIGHEST}};
    const auto j = Engine::revealEntryToJson(room, entry);
    EXPECT_EQ("Bob", j.at("source"));
    EXPECT_EQ("highest", j.at("position"));
}
