#include "main/TrioGame.hh"

#include "coroutines/Lock.hh"
#include "engine/GameError.hh"
#include "engine/Room.hh"
#include "engine/TurnEngine.hh"
#include "main/Commands.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/EventSender.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerJsonSerializer.hh"
#include "messaging/RoomJsonSerializer.hh"
#include "trio/IdGenerator.hh"
#include "Logging.hh"
#include "Observer.hh"
#include "Utility.hh"

#include <algorithm>
#include <cassert>
#include <map>
#include <sstream>
#include <variant>

namespace Trio {
namespace Main {

using Engine::HandOrigin;
using Engine::Player;
using Engine::RevealOutcome;
using Engine::Room;
using Engine::TurnEngine;
using Messaging::Identity;

namespace {

const auto FIRST_TURN_MESSAGE =
    std::string_view {"It's your turn! Reveal cards to find a trio."};
const auto CONTINUED_TURN_MESSAGE =
    std::string_view {"Great trio! Continue your turn - find another!"};

auto finalScores(const Room& room)
{
    auto players = std::vector<const Player*> {};
    for (const auto& player : room.getPlayers()) {
        players.push_back(&player);
    }
    std::stable_sort(
        players.begin(), players.end(),
        [](const auto* p1, const auto* p2)
        {
            return p1->getNumberOfTrios() > p2->getNumberOfTrios();
        });
    auto ret = nlohmann::json::array();
    for (const auto* player : players) {
        ret.push_back(
            nlohmann::json {
                {NAME_KEY, player->getName()},
                {TRIOS_KEY, player->getNumberOfTrios()},
            });
    }
    return ret;
}

}

class TrioGame::Impl :
    public Observer<TurnEngine::GameStarted>,
    public Observer<TurnEngine::HandChanged>,
    public Observer<TurnEngine::TurnStarted>,
    public Observer<TurnEngine::CardRevealed>,
    public Observer<TurnEngine::StateChanged>,
    public Observer<TurnEngine::RevealMatched>,
    public Observer<TurnEngine::TrioCompleted>,
    public Observer<TurnEngine::TurnFailed>,
    public Observer<TurnEngine::GameEnded> {
public:

    Impl(
        std::shared_ptr<Room> room,
        std::shared_ptr<Messaging::EventSender> eventSender);

    std::string join(const Identity& identity, std::string name);
    bool leave(const Identity& identity);
    void setMode(const Identity& identity, std::string_view mode);
    void start(const Identity& identity, const std::vector<Card>* deck);
    RevealOutcome revealFromMiddle(const Identity& identity, int cardId);
    RevealOutcome revealFromPlayer(
        const Identity& identity, std::string_view targetId,
        std::string_view position);
    void endFailedTurn();
    void chat(const Identity& identity, std::string_view message);
    void sendError(const Identity& identity, std::string_view message);
    std::optional<std::string> getPlayerId(const Identity& identity) const;
    const Room& getRoom() const { return *room; }
    TurnEngine& getEngine() { return engine; }
    Coroutines::Mutex& getMutex() { return mutex; }
    Counter getCounter() const { return counter; }

private:

    const std::string& internalRequireSeat(const Identity& identity) const;
    std::string internalEventName(std::string_view event) const;
    void internalDeliver(
        Player& player, const std::string& event,
        const nlohmann::json& params);
    void publish(
        std::string_view event, nlohmann::json params,
        const std::string* excludedId = nullptr);
    void sendToPlayer(
        const std::string& playerId, std::string_view event,
        nlohmann::json params);

    void handleNotify(const TurnEngine::GameStarted&) override;
    void handleNotify(const TurnEngine::HandChanged&) override;
    void handleNotify(const TurnEngine::TurnStarted&) override;
    void handleNotify(const TurnEngine::CardRevealed&) override;
    void handleNotify(const TurnEngine::StateChanged&) override;
    void handleNotify(const TurnEngine::RevealMatched&) override;
    void handleNotify(const TurnEngine::TrioCompleted&) override;
    void handleNotify(const TurnEngine::TurnFailed&) override;
    void handleNotify(const TurnEngine::GameEnded&) override;

    const std::shared_ptr<Room> room;
    const std::shared_ptr<Messaging::EventSender> eventSender;
    TurnEngine engine;
    Coroutines::Mutex mutex;
    Counter counter;
    std::map<Identity, std::string> seats;
};

TrioGame::Impl::Impl(
    std::shared_ptr<Room> room,
    std::shared_ptr<Messaging::EventSender> eventSender) :
    room {std::move(room)},
    eventSender {std::move(eventSender)},
    engine {this->room},
    mutex {},
    counter {},
    seats {}
{
}

const std::string& TrioGame::Impl::internalRequireSeat(
    const Identity& identity) const
{
    const auto iter = seats.find(identity);
    if (iter == seats.end()) {
        throw Engine::TargetError {"Not in a room"};
    }
    return iter->second;
}

std::string TrioGame::Impl::internalEventName(
    const std::string_view event) const
{
    std::ostringstream os;
    os << room->getCode() << ':' << event;
    return os.str();
}

void TrioGame::Impl::internalDeliver(
    Player& player, const std::string& event, const nlohmann::json& params)
{
    if (!player.isConnected()) {
        return;
    }
    const auto iter = std::find_if(
        seats.begin(), seats.end(),
        [&player](const auto& seat) { return seat.second == player.getId(); });
    if (iter == seats.end()) {
        return;
    }
    if (!dereference(eventSender).send(iter->first, event, params)) {
        log(LogLevel::WARNING,
            "Failed to deliver %s to player %s in room %s. Marking disconnected",
            event, player.getId(), room->getCode());
        player.setConnected(false);
    }
}

void TrioGame::Impl::publish(
    const std::string_view event, nlohmann::json params,
    const std::string* excludedId)
{
    log(LogLevel::DEBUG, "Publishing event in room %s: %s",
        room->getCode(), event);
    ++counter;
    params[std::string {COUNTER_KEY}] = counter;
    const auto event_name = internalEventName(event);
    auto ids = std::vector<std::string> {};
    for (const auto& player : room->getPlayers()) {
        if (!excludedId || player.getId() != *excludedId) {
            ids.push_back(player.getId());
        }
    }
    for (const auto& id : ids) {
        internalDeliver(dereference(room->getPlayer(id)), event_name, params);
    }
}

void TrioGame::Impl::sendToPlayer(
    const std::string& playerId, const std::string_view event,
    nlohmann::json params)
{
    log(LogLevel::DEBUG, "Sending event to player %s in room %s: %s",
        playerId, room->getCode(), event);
    ++counter;
    params[std::string {COUNTER_KEY}] = counter;
    if (auto* player = room->getPlayer(playerId)) {
        internalDeliver(*player, internalEventName(event), params);
    }
}

std::string TrioGame::Impl::join(const Identity& identity, std::string name)
{
    if (seats.find(identity) != seats.end()) {
        throw Engine::PhaseError {"Already in a room"};
    }
    auto player_id = generatePlayerId();
    while (room->getPlayer(player_id)) {
        player_id = generatePlayerId();
    }
    const auto& player = room->join(player_id, std::move(name));
    seats.emplace(identity, player_id);
    log(LogLevel::DEBUG, "Player %s (%s) joined room %s",
        player.getId(), player.getName(), room->getCode());
    publish(
        PLAYER_JOINED_EVENT,
        nlohmann::json {{PLAYER_KEY, player}, {ROOM_KEY, *room}});
    sendToPlayer(
        player_id, WELCOME_EVENT,
        nlohmann::json {{PLAYER_ID_KEY, player_id}, {ROOM_KEY, *room}});
    return player_id;
}

bool TrioGame::Impl::leave(const Identity& identity)
{
    const auto player_id = internalRequireSeat(identity);
    auto& player = dereference(room->getPlayer(player_id));
    player.setConnected(false);
    publish(
        PLAYER_DISCONNECTED_EVENT,
        nlohmann::json {
            {PLAYER_ID_KEY, player_id},
            {PLAYER_NAME_KEY, player.getName()},
            {ROOM_KEY, *room},
        },
        &player_id);
    seats.erase(identity);
    const auto removed = room->leave(player_id);
    log(LogLevel::DEBUG, "Player %s left room %s. Seat removed: %s",
        player_id, room->getCode(), removed);
    return room->getPhase() == Engine::Phase::WAITING &&
        room->getNumberOfPlayers() == 0;
}

void TrioGame::Impl::setMode(
    const Identity& identity, const std::string_view mode)
{
    internalRequireSeat(identity);
    room->setMode(gameModeFromString(mode));
    publish(
        MODE_CHANGED_EVENT,
        nlohmann::json {{MODE_KEY, room->getMode()}, {ROOM_KEY, *room}});
}

void TrioGame::Impl::start(
    const Identity& identity, const std::vector<Card>* deck)
{
    internalRequireSeat(identity);
    if (deck) {
        engine.startGame(*deck);
    } else {
        engine.startGame();
    }
}

RevealOutcome TrioGame::Impl::revealFromMiddle(
    const Identity& identity, const int cardId)
{
    return engine.revealFromMiddle(internalRequireSeat(identity), cardId);
}

RevealOutcome TrioGame::Impl::revealFromPlayer(
    const Identity& identity, const std::string_view targetId,
    const std::string_view position)
{
    return engine.revealFromPlayer(
        internalRequireSeat(identity), targetId, position);
}

void TrioGame::Impl::endFailedTurn()
{
    engine.endFailedTurn();
}

void TrioGame::Impl::chat(
    const Identity& identity, const std::string_view message)
{
    const auto& player_id = internalRequireSeat(identity);
    const auto& player = dereference(room->getPlayer(player_id));
    publish(
        CHAT_EVENT,
        nlohmann::json {
            {PLAYER_KEY, player.getName()}, {MESSAGE_KEY, message}});
}

void TrioGame::Impl::sendError(
    const Identity& identity, const std::string_view message)
{
    ++counter;
    const auto params = nlohmann::json {
        {MESSAGE_KEY, message}, {COUNTER_KEY, counter}};
    if (!dereference(eventSender).send(
            identity, internalEventName(ERROR_EVENT), params)) {
        log(LogLevel::WARNING, "Failed to deliver error to %s", identity);
    }
}

std::optional<std::string> TrioGame::Impl::getPlayerId(
    const Identity& identity) const
{
    const auto iter = seats.find(identity);
    if (iter == seats.end()) {
        return std::nullopt;
    }
    return iter->second;
}

void TrioGame::Impl::handleNotify(const TurnEngine::GameStarted& event)
{
    const auto& room = event.room;
    const auto& current_player = dereference(room.getCurrentPlayer());
    log(LogLevel::INFO, "Game started in room %s. Mode: %s. Players: %d",
        room.getCode(), room.getMode(), room.getNumberOfPlayers());
    auto turn_order = nlohmann::json::array();
    for (const auto* player : room.getTurnOrder()) {
        turn_order.push_back(dereference(player).getName());
    }
    publish(
        GAME_STARTED_EVENT,
        nlohmann::json {
            {MODE_KEY, room.getMode()},
            {TURN_ORDER_KEY, std::move(turn_order)},
            {CURRENT_PLAYER_KEY, current_player.getName()},
            {CURRENT_PLAYER_ID_KEY, current_player.getId()},
            {MIDDLE_CARD_COUNT_KEY, room.getMiddle().size()},
            {ROOM_KEY, room},
        });
}

void TrioGame::Impl::handleNotify(const TurnEngine::HandChanged& event)
{
    sendToPlayer(
        event.player.getId(), YOUR_HAND_EVENT,
        nlohmann::json {{HAND_KEY, Engine::handToJson(event.player)}});
}

void TrioGame::Impl::handleNotify(const TurnEngine::TurnStarted& event)
{
    log(LogLevel::DEBUG, "Turn started in room %s. Player: %s. Kind: %s",
        room->getCode(), event.player.getId(), event.kind);
    if (event.kind == TurnEngine::TurnKind::NEXT) {
        publish(
            TURN_CHANGED_EVENT,
            nlohmann::json {
                {CURRENT_PLAYER_KEY, event.player.getName()},
                {CURRENT_PLAYER_ID_KEY, event.player.getId()},
            });
    }
    const auto message = event.kind == TurnEngine::TurnKind::CONTINUED ?
        CONTINUED_TURN_MESSAGE : FIRST_TURN_MESSAGE;
    sendToPlayer(
        event.player.getId(), YOUR_TURN_EVENT,
        nlohmann::json {{MESSAGE_KEY, message}});
}

void TrioGame::Impl::handleNotify(const TurnEngine::CardRevealed& event)
{
    log(LogLevel::DEBUG, "Card revealed in room %s: %s",
        room->getCode(), event.entry.card);
    auto params = Engine::revealEntryToJson(*room, event.entry);
    if (const auto* origin = std::get_if<HandOrigin>(&event.entry.origin)) {
        params[std::string {SOURCE_ID_KEY}] = origin->playerId;
    }
    params[std::string {REVEALED_BY_KEY}] = event.revealer.getName();
    params[std::string {SHOW_TO_ALL_KEY}] = true;
    publish(CARD_REVEALED_EVENT, std::move(params));
}

void TrioGame::Impl::handleNotify(const TurnEngine::StateChanged& event)
{
    publish(GAME_STATE_EVENT, Engine::gameStateToJson(event.room));
}

void TrioGame::Impl::handleNotify(const TurnEngine::RevealMatched& event)
{
    std::ostringstream os;
    os << "Match! (" << event.number << ") Keep revealing...";
    publish(
        REVEAL_MATCH_EVENT,
        nlohmann::json {{MESSAGE_KEY, os.str()}, {COUNT_KEY, event.count}});
}

void TrioGame::Impl::handleNotify(const TurnEngine::TrioCompleted& event)
{
    log(LogLevel::DEBUG, "Trio completed in room %s. Player: %s. Number: %d",
        room->getCode(), event.player.getId(), event.number);
    std::ostringstream os;
    os << event.player.getName() << " got a trio of " << event.number << "s!";
    publish(
        TRIO_COMPLETE_EVENT,
        nlohmann::json {
            {PLAYER_KEY, event.player.getName()},
            {PLAYER_ID_KEY, event.player.getId()},
            {TRIO_NUMBER_KEY, event.number},
            {MESSAGE_KEY, os.str()},
        });
}

void TrioGame::Impl::handleNotify(const TurnEngine::TurnFailed& event)
{
    log(LogLevel::DEBUG, "Turn failed in room %s. Player: %s",
        room->getCode(), event.player.getId());
    std::ostringstream os;
    os << "Different numbers! " << event.player.getName() << "'s turn ends.";
    publish(
        TURN_FAILED_EVENT,
        nlohmann::json {
            {PLAYER_KEY, event.player.getName()},
            {MESSAGE_KEY, os.str()},
            {DELAY_RETURN_KEY, true},
        });
}

void TrioGame::Impl::handleNotify(const TurnEngine::GameEnded& event)
{
    log(LogLevel::INFO, "Game over in room %s. Winner: %s. Reason: %s",
        room->getCode(), event.winner.getId(), event.win);
    const auto reason = describeWin(event.win);
    auto params = nlohmann::json {
        {WINNER_KEY, event.winner.getName()},
        {WINNER_ID_KEY, event.winner.getId()},
        {REASON_KEY, Messaging::enumToJson(
                event.win.reason, Engine::WIN_REASON_TO_STRING_MAP.left)},
        {MESSAGE_KEY, event.winner.getName() + " wins! " + reason},
        {FINAL_SCORES_KEY, finalScores(*room)},
    };
    if (event.win.connected) {
        params[std::string {CONNECTED_KEY}] = nlohmann::json::array(
            {event.win.connected->first, event.win.connected->second});
    }
    publish(GAME_OVER_EVENT, std::move(params));
}

TrioGame::TrioGame(
    std::string code, std::string name, const GameMode mode,
    const int minPlayers, const int maxPlayers,
    std::shared_ptr<Messaging::EventSender> eventSender) :
    impl {
        std::make_shared<Impl>(
            std::make_shared<Room>(
                std::move(code), std::move(name), mode, minPlayers,
                maxPlayers),
            std::move(eventSender))}
{
    auto& engine = impl->getEngine();
    engine.subscribeToGameStarted(impl);
    engine.subscribeToHandChanged(impl);
    engine.subscribeToTurnStarted(impl);
    engine.subscribeToCardRevealed(impl);
    engine.subscribeToStateChanged(impl);
    engine.subscribeToRevealMatched(impl);
    engine.subscribeToTrioCompleted(impl);
    engine.subscribeToTurnFailed(impl);
    engine.subscribeToGameEnded(impl);
}

std::string TrioGame::join(const Identity& identity, std::string name)
{
    assert(impl);
    return impl->join(identity, std::move(name));
}

bool TrioGame::leave(const Identity& identity)
{
    assert(impl);
    return impl->leave(identity);
}

void TrioGame::setMode(const Identity& identity, const std::string_view mode)
{
    assert(impl);
    impl->setMode(identity, mode);
}

void TrioGame::start(const Identity& identity)
{
    assert(impl);
    impl->start(identity, nullptr);
}

void TrioGame::start(
    const Identity& identity, const std::vector<Card>& deck)
{
    assert(impl);
    impl->start(identity, &deck);
}

RevealOutcome TrioGame::revealFromMiddle(
    const Identity& identity, const int cardId)
{
    assert(impl);
    return impl->revealFromMiddle(identity, cardId);
}

RevealOutcome TrioGame::revealFromPlayer(
    const Identity& identity, const std::string_view targetId,
    const std::string_view position)
{
    assert(impl);
    return impl->revealFromPlayer(identity, targetId, position);
}

void TrioGame::endFailedTurn()
{
    assert(impl);
    impl->endFailedTurn();
}

void TrioGame::chat(const Identity& identity, const std::string_view message)
{
    assert(impl);
    impl->chat(identity, message);
}

void TrioGame::sendError(
    const Identity& identity, const std::string_view message)
{
    assert(impl);
    impl->sendError(identity, message);
}

std::optional<std::string> TrioGame::getPlayerId(
    const Identity& identity) const
{
    assert(impl);
    return impl->getPlayerId(identity);
}

const Room& TrioGame::getRoom() const
{
    assert(impl);
    return impl->getRoom();
}

Coroutines::Mutex& TrioGame::getMutex()
{
    assert(impl);
    return impl->getMutex();
}

TrioGame::Counter TrioGame::getCounter() const
{
    assert(impl);
    return impl->getCounter();
}

}
}
