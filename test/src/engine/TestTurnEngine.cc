#include "engine/GameError.hh"
#include "engine/TurnEngine.hh"
#include "trio/CardShuffle.hh"
#include "trio/TrioConstants.hh"
#include "MockObserver.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

using testing::_;
using testing::ElementsAre;
using testing::InSequence;
using testing::Invoke;

using namespace Trio;
using Engine::RevealOutcome;
using Engine::TurnEngine;

class TurnEngineTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        for (auto i = 1; i <= 3; ++i) {
            room->join("p" + std::to_string(i), "Player " + std::to_string(i));
        }
        engine.subscribeToGameStarted(gameStartedObserver);
        engine.subscribeToHandChanged(handChangedObserver);
        engine.subscribeToTurnStarted(turnStartedObserver);
        engine.subscribeToCardRevealed(cardRevealedObserver);
        engine.subscribeToStateChanged(stateChangedObserver);
        engine.subscribeToRevealMatched(revealMatchedObserver);
        engine.subscribeToTrioCompleted(trioCompletedObserver);
        engine.subscribeToTurnFailed(turnFailedObserver);
        engine.subscribeToGameEnded(gameEndedObserver);
    }

    const Engine::Player& currentPlayer()
    {
        return *room->getCurrentPlayer();
    }

    // Hands in join order: p1 1-3, p2 4-6, p3 7-9. Middle ids 27-35 hold
    // 10-12.
    void startGame()
    {
        engine.startGame(generateDeck());
    }

    template<typename Event>
    using ObserverPtr = MockObserverPtr<Event>;

    std::shared_ptr<Engine::Room> room {
        std::make_shared<Engine::Room>("ABCDE", "Room", GameMode::SIMPLE)};
    TurnEngine engine {room};
    ObserverPtr<TurnEngine::GameStarted> gameStartedObserver {
        makeMockObserver<TurnEngine::GameStarted>()};
    ObserverPtr<TurnEngine::HandChanged> handChangedObserver {
        makeMockObserver<TurnEngine::HandChanged>()};
    ObserverPtr<TurnEngine::TurnStarted> turnStartedObserver {
        makeMockObserver<TurnEngine::TurnStarted>()};
    ObserverPtr<TurnEngine::CardRevealed> cardRevealedObserver {
        makeMockObserver<TurnEngine::CardRevealed>()};
    ObserverPtr<TurnEngine::StateChanged> stateChangedObserver {
        makeMockObserver<TurnEngine::StateChanged>()};
    ObserverPtr<TurnEngine::RevealMatched> revealMatchedObserver {
        makeMockObserver<TurnEngine::RevealMatched>()};
    ObserverPtr<TurnEngine::TrioCompleted> trioCompletedObserver {
        makeMockObserver<TurnEngine::TrioCompleted>()};
    ObserverPtr<TurnEngine::TurnFailed> turnFailedObserver {
        makeMockObserver<TurnEngine::TurnFailed>()};
    ObserverPtr<TurnEngine::GameEnded> gameEndedObserver {
        makeMockObserver<TurnEngine::GameEnded>()};
};

TEST_F(TurnEngineTest, testRevealBeforeStart)
{
    EXPECT_THROW(engine.revealFromMiddle("p1", 27), Engine::PhaseError);
    EXPECT_FALSE(engine.hasEnded());
    EXPECT_FALSE(engine.isTurnEnding());
}

TEST_F(TurnEngineTest, testStartGame)
{
    EXPECT_CALL(
        *gameStartedObserver, handleNotify(TurnEngine::GameStarted {*room}));
    for (const auto& player : room->getPlayers()) {
        EXPECT_CALL(
            *handChangedObserver,
            handleNotify(TurnEngine::HandChanged {player}));
    }
    EXPECT_CALL(*turnStartedObserver, handleNotify(_))
        .WillOnce(
            Invoke(
                [this](const TurnEngine::TurnStarted& event)
                {
                    EXPECT_EQ(room->getCurrentPlayer(), &event.player);
                    EXPECT_EQ(TurnEngine::TurnKind::FIRST, event.kind);
                }));
    EXPECT_CALL(
        *stateChangedObserver,
        handleNotify(TurnEngine::StateChanged {*room}));
    startGame();
    EXPECT_EQ(Engine::Phase::PLAYING, room->getPhase());
}

TEST_F(TurnEngineTest, testStartWithTooFewPlayers)
{
    room->leave("p3");
    EXPECT_CALL(*gameStartedObserver, handleNotify(_)).Times(0);
    EXPECT_THROW(startGame(), Engine::CapacityError);
}

TEST_F(TurnEngineTest, testStartTwice)
{
    startGame();
    EXPECT_THROW(startGame(), Engine::PhaseError);
}

TEST_F(TurnEngineTest, testRevealOutOfTurn)
{
    startGame();
    const auto& current = currentPlayer();
    const auto other_id = current.getId() == "p1" ? "p2" : "p1";
    EXPECT_CALL(*cardRevealedObserver, handleNotify(_)).Times(0);
    try {
        engine.revealFromMiddle(other_id, 27);
        FAIL() << "Expected TurnError";
    } catch (const Engine::TurnError& e) {
        EXPECT_STREQ("It's not your turn!", e.what());
    }
    EXPECT_TRUE(room->getRevealSequence().empty());
}

TEST_F(TurnEngineTest, testRevealInvalidPosition)
{
    startGame();
    try {
        engine.revealFromPlayer(currentPlayer().getId(), "p1", "middle");
        FAIL() << "Expected TargetError";
    } catch (const Engine::TargetError& e) {
        EXPECT_STREQ("Must reveal 'lowest' or 'highest'", e.what());
    }
}

TEST_F(TurnEngineTest, testRevealMissingCard)
{
    startGame();
    EXPECT_CALL(*cardRevealedObserver, handleNotify(_)).Times(0);
    EXPECT_THROW(
        engine.revealFromMiddle(currentPlayer().getId(), 0),
        Engine::TargetError);
}

TEST_F(TurnEngineTest, testFirstRevealIsPending)
{
    startGame();
    const auto& current = currentPlayer();
    EXPECT_CALL(
        *cardRevealedObserver,
        handleNotify(
            TurnEngine::CardRevealed {
                current,
                Engine::RevealEntry {Card {27, 10}, Engine::MiddleOrigin {0}}}));
    EXPECT_CALL(*stateChangedObserver, handleNotify(_));
    EXPECT_EQ(
        RevealOutcome::PENDING, engine.revealFromMiddle(current.getId(), 27));
}

TEST_F(TurnEngineTest, testRevealFromHandNotifiesTarget)
{
    startGame();
    const auto& target = *room->getPlayer("p2");
    {
        InSequence sequence;
        EXPECT_CALL(*cardRevealedObserver, handleNotify(_));
        EXPECT_CALL(
            *handChangedObserver,
            handleNotify(TurnEngine::HandChanged {target}));
    }
    EXPECT_CALL(*stateChangedObserver, handleNotify(_)).Times(2);
    EXPECT_EQ(
        RevealOutcome::PENDING,
        engine.revealFromPlayer(currentPlayer().getId(), "p2", "lowest"));
    EXPECT_EQ(8, target.getNumberOfCards());
}

TEST_F(TurnEngineTest, testMatchingReveal)
{
    startGame();
    const auto& id = currentPlayer().getId();
    engine.revealFromMiddle(id, 27);
    EXPECT_CALL(
        *revealMatchedObserver,
        handleNotify(TurnEngine::RevealMatched {10, 2}));
    EXPECT_EQ(RevealOutcome::CONTINUE, engine.revealFromMiddle(id, 28));
}

TEST_F(TurnEngineTest, testTrio)
{
    startGame();
    const auto& current = currentPlayer();
    const auto& id = current.getId();
    engine.revealFromMiddle(id, 27);
    engine.revealFromMiddle(id, 28);
    {
        InSequence sequence;
        EXPECT_CALL(
            *trioCompletedObserver,
            handleNotify(TurnEngine::TrioCompleted {current, 10}));
        EXPECT_CALL(
            *turnStartedObserver,
            handleNotify(
                TurnEngine::TurnStarted {
                    current, TurnEngine::TurnKind::CONTINUED}));
    }
    EXPECT_CALL(*handChangedObserver, handleNotify(_)).Times(3);
    EXPECT_CALL(*gameEndedObserver, handleNotify(_)).Times(0);
    EXPECT_EQ(RevealOutcome::TRIO, engine.revealFromMiddle(id, 29));
    EXPECT_THAT(current.getTrioNumbers(), ElementsAre(10));
    EXPECT_EQ(&current, room->getCurrentPlayer());
    EXPECT_FALSE(engine.hasEnded());
}

TEST_F(TurnEngineTest, testFailedTurn)
{
    startGame();
    const auto turn_order = room->getTurnOrder();
    const auto& current = currentPlayer();
    const auto& id = current.getId();
    engine.revealFromMiddle(id, 27);
    EXPECT_CALL(
        *turnFailedObserver, handleNotify(TurnEngine::TurnFailed {current}));
    EXPECT_EQ(RevealOutcome::FAIL, engine.revealFromMiddle(id, 30));
    EXPECT_TRUE(engine.isTurnEnding());
    EXPECT_EQ(7, room->getNumberOfFaceDownCards());

    try {
        engine.revealFromMiddle(id, 31);
        FAIL() << "Expected PhaseError";
    } catch (const Engine::PhaseError& e) {
        EXPECT_STREQ("Turn is ending", e.what());
    }

    EXPECT_CALL(
        *turnStartedObserver,
        handleNotify(
            TurnEngine::TurnStarted {
                *turn_order[1], TurnEngine::TurnKind::NEXT}));
    engine.endFailedTurn();
    EXPECT_FALSE(engine.isTurnEnding());
    EXPECT_EQ(9, room->getNumberOfFaceDownCards());
    EXPECT_EQ(turn_order[1], room->getCurrentPlayer());
    EXPECT_TRUE(room->getRevealSequence().empty());
}

TEST_F(TurnEngineTest, testFailedTurnReturnsHandCards)
{
    startGame();
    const auto& id = currentPlayer().getId();
    engine.revealFromPlayer(id, "p1", "lowest");
    engine.revealFromPlayer(id, "p2", "highest");
    ASSERT_TRUE(engine.isTurnEnding());
    EXPECT_CALL(
        *handChangedObserver,
        handleNotify(TurnEngine::HandChanged {*room->getPlayer("p1")}));
    EXPECT_CALL(
        *handChangedObserver,
        handleNotify(TurnEngine::HandChanged {*room->getPlayer("p2")}));
    engine.endFailedTurn();
    EXPECT_EQ(9, room->getPlayer("p1")->getNumberOfCards());
    EXPECT_EQ(9, room->getPlayer("p2")->getNumberOfCards());
}

TEST_F(TurnEngineTest, testEndFailedTurnWithoutFailure)
{
    startGame();
    EXPECT_THROW(engine.endFailedTurn(), Engine::PhaseError);
}

TEST_F(TurnEngineTest, testSevenTrioWins)
{
    startGame();
    const auto& current = currentPlayer();
    const auto& id = current.getId();
    engine.revealFromPlayer(id, "p3", "lowest");
    engine.revealFromPlayer(id, "p3", "lowest");
    EXPECT_CALL(
        *gameEndedObserver,
        handleNotify(
            TurnEngine::GameEnded {
                current,
                Engine::Win {Engine::WinReason::SEVEN_TRIO, std::nullopt}}));
    EXPECT_CALL(*turnStartedObserver, handleNotify(_)).Times(0);
    EXPECT_EQ(
        RevealOutcome::TRIO, engine.revealFromPlayer(id, "p3", "lowest"));
    EXPECT_TRUE(engine.hasEnded());
    EXPECT_EQ(&current, room->getWinner());
    EXPECT_EQ(nullptr, room->getCurrentPlayer());
    try {
        engine.revealFromMiddle(id, 27);
        FAIL() << "Expected PhaseError";
    } catch (const Engine::PhaseError& e) {
        EXPECT_STREQ("Game is over", e.what());
    }
}

TEST_F(TurnEngineTest, testThreeTriosWinSimpleGame)
{
    startGame();
    const auto& current = currentPlayer();
    const auto& id = current.getId();
    for (const auto card_id : {27, 28, 29, 30, 31, 32}) {
        engine.revealFromMiddle(id, card_id);
    }
    EXPECT_FALSE(engine.hasEnded());
    EXPECT_CALL(
        *gameEndedObserver,
        handleNotify(
            TurnEngine::GameEnded {
                current,
                Engine::Win {Engine::WinReason::THREE_TRIOS, std::nullopt}}));
    for (const auto card_id : {33, 34, 35}) {
        engine.revealFromMiddle(id, card_id);
    }
    EXPECT_TRUE(engine.hasEnded());
}

TEST_F(TurnEngineTest, testConnectedTriosWinSpicyGame)
{
    room->setMode(GameMode::SPICY);
    startGame();
    const auto& current = currentPlayer();
    const auto& id = current.getId();
    for (const auto card_id : {27, 28, 29}) {
        engine.revealFromMiddle(id, card_id);
    }
    EXPECT_CALL(
        *gameEndedObserver,
        handleNotify(
            TurnEngine::GameEnded {
                current,
                Engine::Win {
                    Engine::WinReason::CONNECTED_TRIOS, std::pair {10, 11}}}));
    for (const auto card_id : {30, 31, 32}) {
        engine.revealFromMiddle(id, card_id);
    }
    EXPECT_TRUE(engine.hasEnded());
}

namespace {

int countCards(const Engine::Room& room)
{
    auto total = 0;
    for (const auto& player : room.getPlayers()) {
        total += player.getNumberOfCards();
        total += N_COPIES * player.getNumberOfTrios();
    }
    for (const auto& slot : room.getMiddle()) {
        if (slot.state != Engine::MiddleCardState::TAKEN) {
            ++total;
        }
    }
    return total;
}

}

TEST(TurnEngineSimulationTest, testCardsAreConservedAfterEveryResolution)
{
    for (auto seed = 1u; seed <= 25u; ++seed) {
        auto rng = std::mt19937 {seed};
        auto room = std::make_shared<Engine::Room>(
            "ABCDE", "Room", seed % 2 ? GameMode::SIMPLE : GameMode::SPICY);
        const auto n_players = 3 + static_cast<int>(seed % 4);
        for (auto i = 0; i < n_players; ++i) {
            room->join("p" + std::to_string(i), "Player " + std::to_string(i));
        }
        auto engine = TurnEngine {room};
        engine.startGame();
        ASSERT_EQ(N_CARDS, countCards(*room));

        for (auto step = 0; step < 1000 && !engine.hasEnded(); ++step) {
            const auto actor_id = room->getCurrentPlayer()->getId();
            auto middle_ids = std::vector<int> {};
            for (const auto& slot : room->getMiddle()) {
                if (slot.state == Engine::MiddleCardState::FACE_DOWN) {
                    middle_ids.push_back(slot.card.getId());
                }
            }
            auto targets = std::vector<std::string> {};
            for (const auto& player : room->getPlayers()) {
                if (player.getNumberOfCards() > 0) {
                    targets.push_back(player.getId());
                }
            }
            const auto n_choices = middle_ids.size() + 2 * targets.size();
            ASSERT_GT(n_choices, 0u);
            const auto choice =
                std::uniform_int_distribution<std::size_t> {
                    0, n_choices - 1}(rng);
            auto outcome = RevealOutcome::PENDING;
            if (choice < middle_ids.size()) {
                outcome = engine.revealFromMiddle(actor_id, middle_ids[choice]);
            } else {
                const auto n = choice - middle_ids.size();
                outcome = engine.revealFromPlayer(
                    actor_id, targets[n / 2], n % 2 ? "highest" : "lowest");
            }
            if (outcome == RevealOutcome::FAIL) {
                engine.endFailedTurn();
                EXPECT_NE(actor_id, room->getCurrentPlayer()->getId());
            }
            if (outcome == RevealOutcome::FAIL ||
                outcome == RevealOutcome::TRIO) {
                ASSERT_EQ(N_CARDS, countCards(*room))
                    << "seed " << seed << ", step " << step;
                EXPECT_TRUE(room->getRevealSequence().empty());
            }
        }
    }
}
