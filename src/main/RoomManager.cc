#include "main/RoomManager.hh"

#include "coroutines/Lock.hh"
#include "engine/GameError.hh"
#include "engine/RevealOutcome.hh"
#include "engine/Room.hh"
#include "main/Commands.hh"
#include "main/TrioGame.hh"
#include "messaging/EventSender.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/MessageQueue.hh"
#include "messaging/RoomJsonSerializer.hh"
#include "trio/GameMode.hh"
#include "trio/IdGenerator.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <functional>
#include <tuple>
#include <utility>

namespace Trio {
namespace Main {

using Coroutines::AsynchronousExecutionPolicy;
using Messaging::failure;
using Messaging::Identity;
using Messaging::JsonSerializer;
using Messaging::makeMessageHandler;
using Messaging::Reply;
using Messaging::success;

namespace {

auto outcomeToString(const Engine::RevealOutcome outcome)
{
    return Engine::REVEAL_OUTCOME_TO_STRING_MAP.left.at(outcome);
}

}

RoomManager::RoomManager(
    std::shared_ptr<Messaging::EventSender> eventSender,
    const int minPlayers, const int maxPlayers,
    const std::chrono::milliseconds failDelay) :
    eventSender {std::move(eventSender)},
    minPlayers {minPlayers},
    maxPlayers {maxPlayers},
    failDelay {failDelay}
{
}

RoomManager::~RoomManager() = default;

void RoomManager::addHandlers(Messaging::MessageQueue& messageQueue)
{
    messageQueue.trySetHandler(
        asBytes(CREATE_COMMAND),
        makeMessageHandler(
            *this, &RoomManager::create, JsonSerializer {},
            std::tuple {NAME_KEY, MODE_KEY}, std::tuple {ROOM_KEY}));
    messageQueue.trySetHandler(
        asBytes(LIST_COMMAND),
        makeMessageHandler(
            *this, &RoomManager::list, JsonSerializer {},
            std::tuple {}, std::tuple {ROOMS_KEY}));
    messageQueue.trySetHandler(
        asBytes(JOIN_COMMAND),
        makeMessageHandler<AsynchronousExecutionPolicy>(
            *this, &RoomManager::join, JsonSerializer {},
            std::tuple {ROOM_KEY, NAME_KEY}, std::tuple {PLAYER_ID_KEY}));
    messageQueue.trySetHandler(
        asBytes(LEAVE_COMMAND),
        makeMessageHandler<AsynchronousExecutionPolicy>(
            *this, &RoomManager::leave, JsonSerializer {},
            std::tuple {}, std::tuple {}));
    messageQueue.trySetHandler(
        asBytes(SET_MODE_COMMAND),
        makeMessageHandler<AsynchronousExecutionPolicy>(
            *this, &RoomManager::setMode, JsonSerializer {},
            std::tuple {MODE_KEY}, std::tuple {}));
    messageQueue.trySetHandler(
        asBytes(START_GAME_COMMAND),
        makeMessageHandler<AsynchronousExecutionPolicy>(
            *this, &RoomManager::startGame, JsonSerializer {},
            std::tuple {}, std::tuple {}));
    messageQueue.trySetHandler(
        asBytes(REVEAL_MIDDLE_COMMAND),
        makeMessageHandler<AsynchronousExecutionPolicy>(
            *this, &RoomManager::revealMiddle, JsonSerializer {},
            std::tuple {CARD_ID_KEY}, std::tuple {OUTCOME_KEY}));
    messageQueue.trySetHandler(
        asBytes(REVEAL_PLAYER_COMMAND),
        makeMessageHandler<AsynchronousExecutionPolicy>(
            *this, &RoomManager::revealPlayer, JsonSerializer {},
            std::tuple {TARGET_PLAYER_ID_KEY, POSITION_KEY},
            std::tuple {OUTCOME_KEY}));
    messageQueue.trySetHandler(
        asBytes(CHAT_COMMAND),
        makeMessageHandler(
            *this, &RoomManager::chat, JsonSerializer {},
            std::tuple {MESSAGE_KEY}, std::tuple {}));
}

RoomManager::GamePtr RoomManager::internalFindGame(
    const std::string_view code) const
{
    const auto iter = games.find(code);
    return iter != games.end() ? iter->second : nullptr;
}

bool RoomManager::internalIsLive(const GamePtr& game) const
{
    return game && internalFindGame(game->getRoom().getCode()) == game;
}

void RoomManager::internalSendError(
    const Identity& identity, const std::string_view message)
{
    // Errors outside of a room are not ordered by any room counter
    const auto params = nlohmann::json {
        {MESSAGE_KEY, message}, {COUNTER_KEY, 0}};
    auto event = std::string {":"};
    event += ERROR_EVENT;
    if (!dereference(eventSender).send(identity, event, params)) {
        log(LogLevel::WARNING, "Failed to deliver error to %s", identity);
    }
}

void RoomManager::internalCompleteReveal(
    Context& context, TrioGame& game, const bool failed)
{
    if (!failed) {
        return;
    }
    if (failDelay > std::chrono::milliseconds::zero()) {
        context.sleep(failDelay);
    }
    game.endFailedTurn();
}

template<typename ReplyType, typename Function>
ReplyType RoomManager::internalExecuteInRoom(
    Context& context, const Identity& identity, Function&& function)
{
    const auto iter = members.find(identity);
    auto game = iter != members.end() ?
        internalFindGame(iter->second) : nullptr;
    if (!game) {
        internalSendError(identity, "Not in a room");
        return failure();
    }
    Coroutines::Lock lock {context, game->getMutex()};
    // The room may have been destroyed while waiting for the lock
    if (!internalIsLive(game) || !game->getPlayerId(identity)) {
        internalSendError(identity, "Not in a room");
        return failure();
    }
    try {
        return std::invoke(std::forward<Function>(function), *game);
    } catch (const Engine::GameError& e) {
        log(LogLevel::DEBUG, "Command from %s rejected: %s",
            identity, e.what());
        game->sendError(identity, e.what());
    }
    return failure();
}

Reply<std::string> RoomManager::create(
    const Identity& identity, std::string name,
    std::optional<std::string> mode)
{
    log(LogLevel::DEBUG, "Create command from %s. Name: %s", identity, name);
    auto code = generateRoomCode();
    while (games.find(code) != games.end()) {
        code = generateRoomCode();
    }
    const auto game_mode = mode ? gameModeFromString(*mode) : GameMode::SIMPLE;
    games.emplace(
        code,
        std::make_shared<TrioGame>(
            code, std::move(name), game_mode, minPlayers, maxPlayers,
            eventSender));
    log(LogLevel::INFO, "Room %s created. Mode: %s", code, game_mode);
    return success(std::move(code));
}

Reply<nlohmann::json> RoomManager::list(const Identity& identity)
{
    log(LogLevel::DEBUG, "List command from %s", identity);
    auto rooms = nlohmann::json::array();
    for (const auto& [code, game] : games) {
        const auto& room = game->getRoom();
        if (room.isJoinable()) {
            rooms.emplace_back(room);
        }
    }
    return success(std::move(rooms));
}

Reply<std::string> RoomManager::join(
    Context context, const Identity& identity, std::string room,
    std::string name)
{
    log(LogLevel::DEBUG, "Join command from %s. Room: %s. Name: %s",
        identity, room, name);
    if (members.find(identity) != members.end()) {
        internalSendError(identity, "Already in a room");
        return failure();
    }
    const auto game = internalFindGame(room);
    if (!game) {
        internalSendError(identity, "Room not found");
        return failure();
    }
    Coroutines::Lock lock {context, game->getMutex()};
    if (!internalIsLive(game)) {
        internalSendError(identity, "Room not found");
        return failure();
    }
    if (members.find(identity) != members.end()) {
        internalSendError(identity, "Already in a room");
        return failure();
    }
    try {
        auto player_id = game->join(identity, std::move(name));
        members.emplace(identity, std::move(room));
        return success(std::move(player_id));
    } catch (const Engine::GameError& e) {
        log(LogLevel::DEBUG, "Join from %s rejected: %s", identity, e.what());
        game->sendError(identity, e.what());
    }
    return failure();
}

Reply<> RoomManager::leave(Context context, const Identity& identity)
{
    log(LogLevel::DEBUG, "Leave command from %s", identity);
    return internalExecuteInRoom<Reply<>>(
        context, identity,
        [this, &identity](TrioGame& game)
        {
            const auto code = game.getRoom().getCode();
            const auto empty = game.leave(identity);
            members.erase(identity);
            if (empty) {
                games.erase(code);
                log(LogLevel::INFO, "Room %s destroyed", code);
            }
            return success();
        });
}

Reply<> RoomManager::setMode(
    Context context, const Identity& identity, std::string mode)
{
    log(LogLevel::DEBUG, "Set mode command from %s. Mode: %s", identity, mode);
    return internalExecuteInRoom<Reply<>>(
        context, identity,
        [&identity, &mode](TrioGame& game)
        {
            game.setMode(identity, mode);
            return success();
        });
}

Reply<> RoomManager::startGame(Context context, const Identity& identity)
{
    log(LogLevel::DEBUG, "Start game command from %s", identity);
    return internalExecuteInRoom<Reply<>>(
        context, identity,
        [&identity](TrioGame& game)
        {
            game.start(identity);
            return success();
        });
}

Reply<std::string> RoomManager::revealMiddle(
    Context context, const Identity& identity, const int cardId)
{
    log(LogLevel::DEBUG, "Reveal middle command from %s. Card: %d",
        identity, cardId);
    return internalExecuteInRoom<Reply<std::string>>(
        context, identity,
        [this, &context, &identity, cardId](TrioGame& game)
        {
            const auto outcome = game.revealFromMiddle(identity, cardId);
            internalCompleteReveal(
                context, game, outcome == Engine::RevealOutcome::FAIL);
            return success(outcomeToString(outcome));
        });
}

Reply<std::string> RoomManager::revealPlayer(
    Context context, const Identity& identity, std::string targetPlayerId,
    std::string position)
{
    log(LogLevel::DEBUG,
        "Reveal player command from %s. Target: %s. Position: %s",
        identity, targetPlayerId, position);
    return internalExecuteInRoom<Reply<std::string>>(
        context, identity,
        [this, &context, &identity, &targetPlayerId, &position](
            TrioGame& game)
        {
            const auto outcome = game.revealFromPlayer(
                identity, targetPlayerId, position);
            internalCompleteReveal(
                context, game, outcome == Engine::RevealOutcome::FAIL);
            return success(outcomeToString(outcome));
        });
}

Reply<> RoomManager::chat(const Identity& identity, std::string message)
{
    log(LogLevel::DEBUG, "Chat command from %s", identity);
    auto* game = getGameOf(identity);
    if (!game) {
        internalSendError(identity, "Not in a room");
        return failure();
    }
    try {
        game->chat(identity, message);
        return success();
    } catch (const Engine::GameError& e) {
        game->sendError(identity, e.what());
    }
    return failure();
}

TrioGame* RoomManager::getGame(const std::string_view code)
{
    return internalFindGame(code).get();
}

TrioGame* RoomManager::getGameOf(const Identity& identity)
{
    const auto iter = members.find(identity);
    if (iter == members.end()) {
        return nullptr;
    }
    return getGame(iter->second);
}

}
}
