#include "engine/GameError.hh"
#include "engine/Room.hh"
#include "trio/CardShuffle.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

using testing::ElementsAre;
using testing::UnorderedElementsAre;

using namespace Trio;
using Engine::HandOrigin;
using Engine::MiddleCardState;
using Engine::MiddleOrigin;
using Engine::Phase;
using Engine::Room;

class RoomTest : public testing::Test {
protected:
    void joinPlayers(const int n)
    {
        for (auto i = 1; i <= n; ++i) {
            room.join("p" + std::to_string(i), "Player " + std::to_string(i));
        }
    }

    void startGame()
    {
        joinPlayers(3);
        room.start(generateDeck());
    }

    Room room {"ABCDE", "Test room", GameMode::SIMPLE};
};

TEST(DealSizeTest, testDealSizes)
{
    EXPECT_EQ(9, Engine::getHandSize(3));
    EXPECT_EQ(9, Engine::getMiddleSize(3));
    EXPECT_EQ(7, Engine::getHandSize(4));
    EXPECT_EQ(8, Engine::getMiddleSize(4));
    EXPECT_EQ(6, Engine::getHandSize(5));
    EXPECT_EQ(6, Engine::getMiddleSize(5));
    EXPECT_EQ(5, Engine::getHandSize(6));
    EXPECT_EQ(6, Engine::getMiddleSize(6));
}

TEST(RoomLimitsTest, testInvalidLimits)
{
    EXPECT_THROW(
        (Room {"ABCDE", "Room", GameMode::SIMPLE, 2, 6}),
        std::invalid_argument);
    EXPECT_THROW(
        (Room {"ABCDE", "Room", GameMode::SIMPLE, 5, 4}),
        std::invalid_argument);
    EXPECT_THROW(
        (Room {"ABCDE", "Room", GameMode::SIMPLE, 3, 7}),
        std::invalid_argument);
}

TEST_F(RoomTest, testInitialState)
{
    EXPECT_EQ("ABCDE", room.getCode());
    EXPECT_EQ("Test room", room.getName());
    EXPECT_EQ(GameMode::SIMPLE, room.getMode());
    EXPECT_EQ(Phase::WAITING, room.getPhase());
    EXPECT_EQ(0, room.getNumberOfPlayers());
    EXPECT_TRUE(room.isJoinable());
    EXPECT_EQ(nullptr, room.getCurrentPlayer());
    EXPECT_EQ(nullptr, room.getWinner());
}

TEST_F(RoomTest, testJoinKeepsOrder)
{
    joinPlayers(3);
    ASSERT_EQ(3, room.getNumberOfPlayers());
    EXPECT_EQ("p1", room.getPlayers()[0].getId());
    EXPECT_EQ("p3", room.getPlayers()[2].getId());
    EXPECT_EQ("Player 2", room.getPlayer("p2")->getName());
}

TEST_F(RoomTest, testJoinFullRoom)
{
    joinPlayers(6);
    EXPECT_FALSE(room.isJoinable());
    EXPECT_THROW(room.join("p7", "Player 7"), Engine::CapacityError);
}

TEST_F(RoomTest, testJoinDuplicateId)
{
    joinPlayers(1);
    EXPECT_THROW(room.join("p1", "Again"), std::invalid_argument);
}

TEST_F(RoomTest, testJoinAfterStart)
{
    startGame();
    EXPECT_FALSE(room.isJoinable());
    EXPECT_THROW(room.join("p4", "Player 4"), Engine::PhaseError);
}

TEST_F(RoomTest, testFullIsReportedBeforePhase)
{
    joinPlayers(6);
    room.start(generateDeck());
    EXPECT_THROW(room.join("p7", "Player 7"), Engine::CapacityError);
}

TEST_F(RoomTest, testLeaveWhileWaiting)
{
    joinPlayers(3);
    EXPECT_TRUE(room.leave("p2"));
    EXPECT_EQ(2, room.getNumberOfPlayers());
    EXPECT_EQ(nullptr, room.getPlayer("p2"));
    EXPECT_FALSE(room.leave("p2"));
}

TEST_F(RoomTest, testLeaveWhilePlaying)
{
    startGame();
    EXPECT_FALSE(room.leave("p2"));
    EXPECT_EQ(3, room.getNumberOfPlayers());
    EXPECT_FALSE(room.getPlayer("p2")->isConnected());
}

TEST_F(RoomTest, testSetMode)
{
    room.setMode(GameMode::SPICY);
    EXPECT_EQ(GameMode::SPICY, room.getMode());
    startGame();
    EXPECT_THROW(room.setMode(GameMode::SIMPLE), Engine::PhaseError);
}

TEST_F(RoomTest, testStartWithTooFewPlayers)
{
    joinPlayers(2);
    try {
        room.start(generateDeck());
        FAIL() << "Expected CapacityError";
    } catch (const Engine::CapacityError& e) {
        EXPECT_STREQ("Need at least 3 players to start", e.what());
    }
    EXPECT_EQ(Phase::WAITING, room.getPhase());
}

TEST_F(RoomTest, testStartWithShortDeck)
{
    joinPlayers(3);
    auto deck = generateDeck();
    deck.pop_back();
    EXPECT_THROW(room.start(deck), std::invalid_argument);
    EXPECT_EQ(Phase::WAITING, room.getPhase());
}

TEST_F(RoomTest, testStartTwice)
{
    startGame();
    EXPECT_THROW(room.start(generateDeck()), Engine::PhaseError);
}

TEST_F(RoomTest, testStartDealsInJoinOrder)
{
    startGame();
    EXPECT_EQ(Phase::PLAYING, room.getPhase());
    const auto& players = room.getPlayers();
    EXPECT_EQ(Card(0, 1), players[0].getHand().front());
    EXPECT_EQ(Card(9, 4), players[1].getHand().front());
    EXPECT_EQ(Card(18, 7), players[2].getHand().front());
    for (const auto& player : players) {
        EXPECT_EQ(9, player.getNumberOfCards());
    }
    ASSERT_EQ(9u, room.getMiddle().size());
    EXPECT_EQ(Card(27, 10), room.getMiddle().front().card);
    EXPECT_EQ(9, room.getNumberOfFaceDownCards());
}

TEST_F(RoomTest, testTurnOrderIsPermutationOfPlayers)
{
    startGame();
    const auto order = room.getTurnOrder();
    const auto& players = room.getPlayers();
    EXPECT_THAT(
        order,
        UnorderedElementsAre(&players[0], &players[1], &players[2]));
    EXPECT_EQ(order.front(), room.getCurrentPlayer());
}

TEST_F(RoomTest, testRevealBeforeStart)
{
    joinPlayers(3);
    EXPECT_THROW(room.revealFromMiddle(27), Engine::PhaseError);
    EXPECT_THROW(
        room.revealFromPlayer("p1", HandPosition::LOWEST), Engine::PhaseError);
}

TEST_F(RoomTest, testRevealFromMiddle)
{
    startGame();
    const auto& entry = room.revealFromMiddle(28);
    EXPECT_EQ(Card(28, 10), entry.card);
    EXPECT_EQ(Engine::RevealOrigin {MiddleOrigin {1}}, entry.origin);
    EXPECT_EQ(MiddleCardState::FACE_UP, room.getMiddle()[1].state);
    EXPECT_EQ(8, room.getNumberOfFaceDownCards());
    EXPECT_THAT(room.getRevealedNumbers(), ElementsAre(10));
}

TEST_F(RoomTest, testRevealMissingMiddleCard)
{
    startGame();
    EXPECT_THROW(room.revealFromMiddle(0), Engine::TargetError);
}

TEST_F(RoomTest, testRevealFaceUpMiddleCard)
{
    startGame();
    room.revealFromMiddle(28);
    EXPECT_THROW(room.revealFromMiddle(28), Engine::TargetError);
    EXPECT_EQ(1u, room.getRevealSequence().size());
}

TEST_F(RoomTest, testRevealFromPlayer)
{
    startGame();
    const auto& entry = room.revealFromPlayer("p2", HandPosition::HIGHEST);
    EXPECT_EQ(Card(17, 6), entry.card);
    EXPECT_EQ(
        Engine::RevealOrigin {(HandOrigin {"p2", HandPosition::HIGHEST})},
        entry.origin);
    EXPECT_EQ(8, room.getPlayer("p2")->getNumberOfCards());
}

TEST_F(RoomTest, testRevealFromMissingPlayer)
{
    startGame();
    EXPECT_THROW(
        room.revealFromPlayer("nobody", HandPosition::LOWEST),
        Engine::TargetError);
}

TEST_F(RoomTest, testRevealFromEmptyHand)
{
    startGame();
    for (auto i = 0; i < 9; ++i) {
        room.revealFromPlayer("p1", HandPosition::LOWEST);
    }
    try {
        room.revealFromPlayer("p1", HandPosition::LOWEST);
        FAIL() << "Expected TargetError";
    } catch (const Engine::TargetError& e) {
        EXPECT_STREQ("Player 1 has no cards", e.what());
    }
}

TEST_F(RoomTest, testCaptureTrio)
{
    startGame();
    room.revealFromMiddle(27);
    room.revealFromPlayer("p1", HandPosition::HIGHEST);
    EXPECT_THROW(room.captureTrio(), std::logic_error);
    room.returnRevealedCards();

    room.revealFromMiddle(27);
    room.revealFromMiddle(28);
    room.revealFromMiddle(29);
    EXPECT_EQ(10, room.captureTrio());
    const auto& current = *room.getCurrentPlayer();
    EXPECT_THAT(current.getTrioNumbers(), ElementsAre(10));
    for (auto n = 0; n < 3; ++n) {
        EXPECT_EQ(MiddleCardState::TAKEN, room.getMiddle()[n].state);
    }
    EXPECT_TRUE(room.getRevealSequence().empty());
}

TEST_F(RoomTest, testCaptureTrioFromHands)
{
    startGame();
    room.revealFromPlayer("p3", HandPosition::LOWEST);
    room.revealFromPlayer("p3", HandPosition::LOWEST);
    room.revealFromPlayer("p3", HandPosition::LOWEST);
    EXPECT_EQ(7, room.captureTrio());
    EXPECT_EQ(6, room.getPlayer("p3")->getNumberOfCards());
    EXPECT_EQ(9, room.getNumberOfFaceDownCards());
}

TEST_F(RoomTest, testReturnRevealedCards)
{
    startGame();
    room.revealFromPlayer("p2", HandPosition::LOWEST);
    room.revealFromMiddle(30);
    room.revealFromPlayer("p1", HandPosition::HIGHEST);
    room.revealFromPlayer("p2", HandPosition::HIGHEST);
    const auto returned = room.returnRevealedCards();
    EXPECT_THAT(
        returned, ElementsAre(room.getPlayer("p2"), room.getPlayer("p1")));
    EXPECT_EQ(9, room.getPlayer("p1")->getNumberOfCards());
    EXPECT_EQ(9, room.getPlayer("p2")->getNumberOfCards());
    EXPECT_EQ(Card(9, 4), room.getPlayer("p2")->getHand().front());
    EXPECT_EQ(9, room.getNumberOfFaceDownCards());
    EXPECT_TRUE(room.getRevealSequence().empty());
}

TEST_F(RoomTest, testAdvanceTurnWraps)
{
    startGame();
    const auto order = room.getTurnOrder();
    for (const auto* expected : {order[1], order[2], order[0]}) {
        room.advanceTurn();
        EXPECT_EQ(expected, room.getCurrentPlayer());
    }
}

TEST_F(RoomTest, testFinish)
{
    startGame();
    const auto win = Engine::Win {Engine::WinReason::SEVEN_TRIO, std::nullopt};
    EXPECT_THROW(room.finish("nobody", win), std::invalid_argument);
    room.finish("p2", win);
    EXPECT_EQ(Phase::FINISHED, room.getPhase());
    EXPECT_EQ(room.getPlayer("p2"), room.getWinner());
    EXPECT_EQ(win, room.getWin());
    EXPECT_EQ(nullptr, room.getCurrentPlayer());
    EXPECT_THROW(room.revealFromMiddle(27), Engine::PhaseError);
}
