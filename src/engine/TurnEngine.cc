#include "engine/TurnEngine.hh"

#include "engine/GameError.hh"
#include "trio/CardShuffle.hh"
#include "trio/HandPosition.hh"
#include "FunctionQueue.hh"
#include "IoUtility.hh"
#include "Utility.hh"

#include <boost/statechart/custom_reaction.hpp>
#include <boost/statechart/event.hpp>
#include <boost/statechart/simple_state.hpp>
#include <boost/statechart/state_machine.hpp>
#include <boost/statechart/transition.hpp>

#include <cassert>
#include <map>
#include <ostream>
#include <variant>

namespace sc = boost::statechart;

namespace Trio {
namespace Engine {

////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////

class StartGameEvent : public sc::event<StartGameEvent> {};
class CardRevealedEvent : public sc::event<CardRevealedEvent> {
public:
    CardRevealedEvent(RevealEntry entry, RevealOutcome& outcome) :
        entry {std::move(entry)},
        outcome {outcome}
    {
    }

    RevealEntry entry;
    RevealOutcome& outcome;
};
class EndFailedTurnEvent : public sc::event<EndFailedTurnEvent> {};

////////////////////////////////////////////////////////////////////////////////
// TurnEngine::Impl
////////////////////////////////////////////////////////////////////////////////

class Waiting;

class TurnEngine::Impl :
    public sc::state_machine<TurnEngine::Impl, Waiting> {
public:
    explicit Impl(std::shared_ptr<Room> room);

    Room& getRoom() { return dereference(room); }
    const Room& getRoom() const { return dereference(room); }

    void notifyStateChanged();
    void notifyHandChanged(const Player& player);

    Observable<GameStarted>& getGameStartedNotifier()
    {
        return gameStartedNotifier;
    }
    Observable<HandChanged>& getHandChangedNotifier()
    {
        return handChangedNotifier;
    }
    Observable<TurnStarted>& getTurnStartedNotifier()
    {
        return turnStartedNotifier;
    }
    Observable<CardRevealed>& getCardRevealedNotifier()
    {
        return cardRevealedNotifier;
    }
    Observable<StateChanged>& getStateChangedNotifier()
    {
        return stateChangedNotifier;
    }
    Observable<RevealMatched>& getRevealMatchedNotifier()
    {
        return revealMatchedNotifier;
    }
    Observable<TrioCompleted>& getTrioCompletedNotifier()
    {
        return trioCompletedNotifier;
    }
    Observable<TurnFailed>& getTurnFailedNotifier()
    {
        return turnFailedNotifier;
    }
    Observable<GameEnded>& getGameEndedNotifier()
    {
        return gameEndedNotifier;
    }

    FunctionQueue functionQueue;

private:

    const std::shared_ptr<Room> room;
    Observable<GameStarted> gameStartedNotifier;
    Observable<HandChanged> handChangedNotifier;
    Observable<TurnStarted> turnStartedNotifier;
    Observable<CardRevealed> cardRevealedNotifier;
    Observable<StateChanged> stateChangedNotifier;
    Observable<RevealMatched> revealMatchedNotifier;
    Observable<TrioCompleted> trioCompletedNotifier;
    Observable<TurnFailed> turnFailedNotifier;
    Observable<GameEnded> gameEndedNotifier;
};

TurnEngine::Impl::Impl(std::shared_ptr<Room> room) :
    room {std::move(room)}
{
}

void TurnEngine::Impl::notifyStateChanged()
{
    stateChangedNotifier.notifyAll(TurnEngine::StateChanged {getRoom()});
}

void TurnEngine::Impl::notifyHandChanged(const Player& player)
{
    handChangedNotifier.notifyAll(TurnEngine::HandChanged {player});
}

////////////////////////////////////////////////////////////////////////////////
// Waiting
////////////////////////////////////////////////////////////////////////////////

class Revealing;

class Waiting : public sc::simple_state<Waiting, TurnEngine::Impl> {
public:
    using reactions = sc::custom_reaction<StartGameEvent>;
    sc::result react(const StartGameEvent&);
};

sc::result Waiting::react(const StartGameEvent&)
{
    auto& context = outermost_context();
    const auto& room = context.getRoom();
    context.getGameStartedNotifier().notifyAll(
        TurnEngine::GameStarted {room});
    for (const auto& player : room.getPlayers()) {
        context.notifyHandChanged(player);
    }
    context.getTurnStartedNotifier().notifyAll(
        TurnEngine::TurnStarted {
            dereference(room.getCurrentPlayer()),
            TurnEngine::TurnKind::FIRST});
    context.notifyStateChanged();
    return transit<Revealing>();
}

////////////////////////////////////////////////////////////////////////////////
// Playing
////////////////////////////////////////////////////////////////////////////////

class Playing : public sc::simple_state<Playing, TurnEngine::Impl, Revealing> {
};

////////////////////////////////////////////////////////////////////////////////
// Revealing
////////////////////////////////////////////////////////////////////////////////

class Failing;
class Finished;

class Revealing : public sc::simple_state<Revealing, Playing> {
public:
    using reactions = sc::custom_reaction<CardRevealedEvent>;
    sc::result react(const CardRevealedEvent& event);

private:
    sc::result captureTrio(const Player& player);
};

sc::result Revealing::react(const CardRevealedEvent& event)
{
    auto& context = outermost_context();
    auto& room = context.getRoom();
    const auto& player = dereference(room.getCurrentPlayer());
    context.getCardRevealedNotifier().notifyAll(
        TurnEngine::CardRevealed {player, event.entry});
    if (const auto* origin = std::get_if<HandOrigin>(&event.entry.origin)) {
        context.notifyHandChanged(
            dereference(room.getPlayer(origin->playerId)));
        context.notifyStateChanged();
    }

    const auto numbers = room.getRevealedNumbers();
    event.outcome = evaluateRevealSequence(numbers);
    switch (event.outcome) {
    case RevealOutcome::PENDING:
        context.notifyStateChanged();
        break;
    case RevealOutcome::CONTINUE:
        context.getRevealMatchedNotifier().notifyAll(
            TurnEngine::RevealMatched {
                numbers.back(), static_cast<int>(numbers.size())});
        context.notifyStateChanged();
        break;
    case RevealOutcome::TRIO:
        return captureTrio(player);
    case RevealOutcome::FAIL:
        context.notifyStateChanged();
        context.getTurnFailedNotifier().notifyAll(
            TurnEngine::TurnFailed {player});
        return transit<Failing>();
    }
    return discard_event();
}

sc::result Revealing::captureTrio(const Player& player)
{
    auto& context = outermost_context();
    auto& room = context.getRoom();
    const auto number = room.captureTrio();
    context.getTrioCompletedNotifier().notifyAll(
        TurnEngine::TrioCompleted {player, number});
    for (const auto& p : room.getPlayers()) {
        context.notifyHandChanged(p);
    }
    if (const auto win = checkWin(player, room.getMode())) {
        room.finish(player.getId(), *win);
        context.getGameEndedNotifier().notifyAll(
            TurnEngine::GameEnded {player, *win});
        return transit<Finished>();
    }
    context.notifyStateChanged();
    context.getTurnStartedNotifier().notifyAll(
        TurnEngine::TurnStarted {player, TurnEngine::TurnKind::CONTINUED});
    return discard_event();
}

////////////////////////////////////////////////////////////////////////////////
// Failing
////////////////////////////////////////////////////////////////////////////////

class Failing : public sc::simple_state<Failing, Playing> {
public:
    using reactions = sc::custom_reaction<EndFailedTurnEvent>;
    sc::result react(const EndFailedTurnEvent&);
};

sc::result Failing::react(const EndFailedTurnEvent&)
{
    auto& context = outermost_context();
    auto& room = context.getRoom();
    for (const auto* player : room.returnRevealedCards()) {
        context.notifyHandChanged(dereference(player));
    }
    context.notifyStateChanged();
    room.advanceTurn();
    context.getTurnStartedNotifier().notifyAll(
        TurnEngine::TurnStarted {
            dereference(room.getCurrentPlayer()),
            TurnEngine::TurnKind::NEXT});
    context.notifyStateChanged();
    return transit<Revealing>();
}

////////////////////////////////////////////////////////////////////////////////
// Finished
////////////////////////////////////////////////////////////////////////////////

class Finished : public sc::simple_state<Finished, TurnEngine::Impl> {};

////////////////////////////////////////////////////////////////////////////////
// TurnEngine
////////////////////////////////////////////////////////////////////////////////

TurnEngine::TurnEngine(std::shared_ptr<Room> room) :
    impl {std::make_shared<Impl>(std::move(room))}
{
    impl->initiate();
}

TurnEngine::~TurnEngine() = default;

void TurnEngine::subscribeToGameStarted(
    std::weak_ptr<Observer<GameStarted>> observer)
{
    assert(impl);
    impl->getGameStartedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToHandChanged(
    std::weak_ptr<Observer<HandChanged>> observer)
{
    assert(impl);
    impl->getHandChangedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToTurnStarted(
    std::weak_ptr<Observer<TurnStarted>> observer)
{
    assert(impl);
    impl->getTurnStartedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToCardRevealed(
    std::weak_ptr<Observer<CardRevealed>> observer)
{
    assert(impl);
    impl->getCardRevealedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToStateChanged(
    std::weak_ptr<Observer<StateChanged>> observer)
{
    assert(impl);
    impl->getStateChangedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToRevealMatched(
    std::weak_ptr<Observer<RevealMatched>> observer)
{
    assert(impl);
    impl->getRevealMatchedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToTrioCompleted(
    std::weak_ptr<Observer<TrioCompleted>> observer)
{
    assert(impl);
    impl->getTrioCompletedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToTurnFailed(
    std::weak_ptr<Observer<TurnFailed>> observer)
{
    assert(impl);
    impl->getTurnFailedNotifier().subscribe(std::move(observer));
}

void TurnEngine::subscribeToGameEnded(
    std::weak_ptr<Observer<GameEnded>> observer)
{
    assert(impl);
    impl->getGameEndedNotifier().subscribe(std::move(observer));
}

void TurnEngine::startGame()
{
    startGame(generateShuffledDeck());
}

void TurnEngine::startGame(const std::vector<Card>& deck)
{
    assert(impl);
    impl->getRoom().start(deck);
    impl->functionQueue(
        [&impl = *impl]()
        {
            impl.process_event(StartGameEvent {});
        });
}

RevealOutcome TurnEngine::revealFromMiddle(
    const std::string_view actorId, const int cardId)
{
    assert(impl);
    internalCheckActor(actorId);
    return internalProcessReveal(impl->getRoom().revealFromMiddle(cardId));
}

RevealOutcome TurnEngine::revealFromPlayer(
    const std::string_view actorId, const std::string_view targetId,
    const std::string_view position)
{
    assert(impl);
    internalCheckActor(actorId);
    const auto hand_position = handPositionFromString(position);
    if (!hand_position) {
        throw TargetError {"Must reveal 'lowest' or 'highest'"};
    }
    return internalProcessReveal(
        impl->getRoom().revealFromPlayer(targetId, *hand_position));
}

void TurnEngine::endFailedTurn()
{
    assert(impl);
    if (!isTurnEnding()) {
        throw PhaseError {"No failed turn to end"};
    }
    impl->functionQueue(
        [&impl = *impl]()
        {
            impl.process_event(EndFailedTurnEvent {});
        });
}

bool TurnEngine::isTurnEnding() const
{
    assert(impl);
    return impl->state_cast<const Failing*>() != nullptr;
}

bool TurnEngine::hasEnded() const
{
    assert(impl);
    return impl->getRoom().getPhase() == Phase::FINISHED;
}

const Room& TurnEngine::getRoom() const
{
    assert(impl);
    return impl->getRoom();
}

void TurnEngine::internalCheckActor(const std::string_view actorId) const
{
    const auto& room = impl->getRoom();
    switch (room.getPhase()) {
    case Phase::WAITING:
        throw PhaseError {"Game has not started"};
    case Phase::FINISHED:
        throw PhaseError {"Game is over"};
    case Phase::PLAYING:
        break;
    }
    if (isTurnEnding()) {
        throw PhaseError {"Turn is ending"};
    }
    const auto* current_player = room.getCurrentPlayer();
    if (!current_player || current_player->getId() != actorId) {
        throw TurnError {"It's not your turn!"};
    }
}

RevealOutcome TurnEngine::internalProcessReveal(const RevealEntry& entry)
{
    auto outcome = RevealOutcome::PENDING;
    impl->functionQueue(
        [&impl = *impl, &entry, &outcome]()
        {
            impl.process_event(CardRevealedEvent {entry, outcome});
        });
    return outcome;
}

TurnEngine::GameStarted::GameStarted(const Room& room) :
    room {room}
{
}

bool operator==(
    const TurnEngine::GameStarted& lhs, const TurnEngine::GameStarted& rhs)
{
    return &lhs.room == &rhs.room;
}

TurnEngine::HandChanged::HandChanged(const Player& player) :
    player {player}
{
}

bool operator==(
    const TurnEngine::HandChanged& lhs, const TurnEngine::HandChanged& rhs)
{
    return &lhs.player == &rhs.player;
}

TurnEngine::TurnStarted::TurnStarted(
    const Player& player, const TurnKind kind) :
    player {player},
    kind {kind}
{
}

bool operator==(
    const TurnEngine::TurnStarted& lhs, const TurnEngine::TurnStarted& rhs)
{
    return &lhs.player == &rhs.player && lhs.kind == rhs.kind;
}

TurnEngine::CardRevealed::CardRevealed(
    const Player& revealer, RevealEntry entry) :
    revealer {revealer},
    entry {std::move(entry)}
{
}

bool operator==(
    const TurnEngine::CardRevealed& lhs, const TurnEngine::CardRevealed& rhs)
{
    return &lhs.revealer == &rhs.revealer && lhs.entry == rhs.entry;
}

TurnEngine::StateChanged::StateChanged(const Room& room) :
    room {room}
{
}

bool operator==(
    const TurnEngine::StateChanged& lhs, const TurnEngine::StateChanged& rhs)
{
    return &lhs.room == &rhs.room;
}

TurnEngine::RevealMatched::RevealMatched(const int number, const int count) :
    number {number},
    count {count}
{
}

bool operator==(
    const TurnEngine::RevealMatched& lhs, const TurnEngine::RevealMatched& rhs)
{
    return lhs.number == rhs.number && lhs.count == rhs.count;
}

TurnEngine::TrioCompleted::TrioCompleted(
    const Player& player, const int number) :
    player {player},
    number {number}
{
}

bool operator==(
    const TurnEngine::TrioCompleted& lhs, const TurnEngine::TrioCompleted& rhs)
{
    return &lhs.player == &rhs.player && lhs.number == rhs.number;
}

TurnEngine::TurnFailed::TurnFailed(const Player& player) :
    player {player}
{
}

bool operator==(
    const TurnEngine::TurnFailed& lhs, const TurnEngine::TurnFailed& rhs)
{
    return &lhs.player == &rhs.player;
}

TurnEngine::GameEnded::GameEnded(const Player& winner, const Win& win) :
    winner {winner},
    win {win}
{
}

bool operator==(
    const TurnEngine::GameEnded& lhs, const TurnEngine::GameEnded& rhs)
{
    return &lhs.winner == &rhs.winner && lhs.win == rhs.win;
}

std::ostream& operator<<(std::ostream& os, const TurnEngine::TurnKind kind)
{
    static const auto TURN_KIND_NAMES =
        std::map<TurnEngine::TurnKind, const char*> {
        { TurnEngine::TurnKind::FIRST,     "first"     },
        { TurnEngine::TurnKind::CONTINUED, "continued" },
        { TurnEngine::TurnKind::NEXT,      "next"      },
    };
    return outputEnum(os, kind, TURN_KIND_NAMES);
}

}
}
