#include "engine/Room.hh"

#include "engine/GameError.hh"
#include "engine/RevealOutcome.hh"
#include "trio/Random.hh"
#include "IoUtility.hh"
#include "Utility.hh"

#include <algorithm>
#include <array>
#include <iterator>
#include <initializer_list>
#include <numeric>
#include <ostream>
#include <stdexcept>
#include <string>

namespace Trio {
namespace Engine {

namespace {

const auto PHASE_STRING_PAIRS =
    std::initializer_list<PhaseToStringMap::value_type> {
    { Phase::WAITING,  "waiting"  },
    { Phase::PLAYING,  "playing"  },
    { Phase::FINISHED, "finished" },
};

struct DealSizes {
    int nPlayers;
    int handSize;
    int middleSize;
};

constexpr auto DEAL_SIZES = std::array {
    DealSizes {3, 9, 9},
    DealSizes {4, 7, 8},
    DealSizes {5, 6, 6},
    DealSizes {6, 5, 6},
};

constexpr auto DEFAULT_DEAL_SIZES = DealSizes {0, 5, 6};

DealSizes getDealSizes(const int nPlayers)
{
    const auto iter = std::find_if(
        DEAL_SIZES.begin(), DEAL_SIZES.end(),
        [nPlayers](const auto& sizes) { return sizes.nPlayers == nPlayers; });
    return iter != DEAL_SIZES.end() ? *iter : DEFAULT_DEAL_SIZES;
}

}

const PhaseToStringMap PHASE_TO_STRING_MAP(
    PHASE_STRING_PAIRS.begin(), PHASE_STRING_PAIRS.end());

bool operator==(const MiddleOrigin& lhs, const MiddleOrigin& rhs)
{
    return lhs.slot == rhs.slot;
}

bool operator==(const HandOrigin& lhs, const HandOrigin& rhs)
{
    return lhs.playerId == rhs.playerId && lhs.position == rhs.position;
}

bool operator==(const RevealEntry& lhs, const RevealEntry& rhs)
{
    return &lhs == &rhs || (lhs.card == rhs.card && lhs.origin == rhs.origin);
}

int getHandSize(const int nPlayers)
{
    return getDealSizes(nPlayers).handSize;
}

int getMiddleSize(const int nPlayers)
{
    return getDealSizes(nPlayers).middleSize;
}

Room::Room(
    std::string code, std::string name, const GameMode mode,
    const int minPlayers, const int maxPlayers) :
    code {std::move(code)},
    name {std::move(name)},
    mode {mode},
    minPlayers {minPlayers},
    maxPlayers {maxPlayers}
{
    if (minPlayers < MIN_PLAYERS || minPlayers > maxPlayers ||
        maxPlayers > MAX_PLAYERS) {
        throw std::invalid_argument {"Invalid seat limits"};
    }
}

int Room::getNumberOfPlayers() const
{
    return static_cast<int>(players.size());
}

bool Room::isJoinable() const
{
    return phase == Phase::WAITING && getNumberOfPlayers() < maxPlayers;
}

const Player& Room::join(std::string playerId, std::string playerName)
{
    if (getNumberOfPlayers() >= maxPlayers) {
        throw CapacityError {"Room is full"};
    }
    if (phase != Phase::WAITING) {
        throw PhaseError {"Game already in progress"};
    }
    if (getPlayer(playerId)) {
        throw std::invalid_argument {"Player id already in the room"};
    }
    return players.emplace_back(std::move(playerId), std::move(playerName));
}

bool Room::leave(const std::string_view playerId)
{
    const auto n = internalIndexOf(playerId);
    if (n < 0) {
        return false;
    }
    if (phase == Phase::WAITING) {
        players.erase(players.begin() + n);
        return true;
    }
    players[n].setConnected(false);
    return false;
}

void Room::setMode(const GameMode mode)
{
    if (phase != Phase::WAITING) {
        throw PhaseError {"Game already in progress"};
    }
    this->mode = mode;
}

void Room::start(const std::vector<Card>& deck)
{
    if (phase != Phase::WAITING) {
        throw PhaseError {"Game already in progress"};
    }
    const auto n_players = getNumberOfPlayers();
    if (n_players < minPlayers) {
        throw CapacityError {
            "Need at least " + std::to_string(minPlayers) +
            " players to start"};
    }
    const auto hand_size = getHandSize(n_players);
    const auto middle_size = getMiddleSize(n_players);
    if (std::ssize(deck) < n_players * hand_size + middle_size) {
        throw std::invalid_argument {"Not enough cards to deal"};
    }

    turnOrder.resize(n_players);
    std::iota(turnOrder.begin(), turnOrder.end(), 0);
    std::shuffle(turnOrder.begin(), turnOrder.end(), getRng());
    currentTurn = 0;

    auto iter = deck.begin();
    for (auto& player : players) {
        player.deal(std::vector<Card>(iter, iter + hand_size));
        iter += hand_size;
    }
    middle.clear();
    std::transform(
        iter, iter + middle_size, std::back_inserter(middle),
        [](const auto& card)
        {
            return MiddleSlot {card, MiddleCardState::FACE_DOWN};
        });
    revealSequence.clear();
    phase = Phase::PLAYING;
}

const Player* Room::getPlayer(const std::string_view playerId) const
{
    const auto n = internalIndexOf(playerId);
    return n >= 0 ? &players[n] : nullptr;
}

Player* Room::getPlayer(const std::string_view playerId)
{
    const auto n = internalIndexOf(playerId);
    return n >= 0 ? &players[n] : nullptr;
}

std::vector<const Player*> Room::getTurnOrder() const
{
    auto ret = std::vector<const Player*> {};
    for (const auto n : turnOrder) {
        ret.push_back(&players.at(n));
    }
    return ret;
}

const Player* Room::getCurrentPlayer() const
{
    if (phase != Phase::PLAYING || turnOrder.empty()) {
        return nullptr;
    }
    return &players.at(turnOrder.at(currentTurn));
}

int Room::getNumberOfFaceDownCards() const
{
    return static_cast<int>(
        std::count_if(
            middle.begin(), middle.end(),
            [](const auto& slot)
            {
                return slot.state == MiddleCardState::FACE_DOWN;
            }));
}

std::vector<int> Room::getRevealedNumbers() const
{
    auto ret = std::vector<int> {};
    ret.reserve(revealSequence.size());
    for (const auto& entry : revealSequence) {
        ret.push_back(entry.card.getNumber());
    }
    return ret;
}

const RevealEntry& Room::revealFromMiddle(const int cardId)
{
    internalRequirePlaying();
    const auto iter = std::find_if(
        middle.begin(), middle.end(),
        [cardId](const auto& slot) { return slot.card.getId() == cardId; });
    if (iter == middle.end()) {
        throw TargetError {"Card not found in middle"};
    }
    if (iter->state != MiddleCardState::FACE_DOWN) {
        throw TargetError {"This card is already face up"};
    }
    iter->state = MiddleCardState::FACE_UP;
    const auto slot = static_cast<int>(iter - middle.begin());
    revealSequence.push_back(RevealEntry {iter->card, MiddleOrigin {slot}});
    return revealSequence.back();
}

const RevealEntry& Room::revealFromPlayer(
    const std::string_view targetId, const HandPosition position)
{
    internalRequirePlaying();
    auto* target = getPlayer(targetId);
    if (!target) {
        throw TargetError {"Player not found"};
    }
    const auto card = target->takeCard(position);
    if (!card) {
        throw TargetError {target->getName() + " has no cards"};
    }
    revealSequence.push_back(
        RevealEntry {*card, HandOrigin {target->getId(), position}});
    return revealSequence.back();
}

int Room::captureTrio()
{
    const auto numbers = getRevealedNumbers();
    if (evaluateRevealSequence(numbers) != RevealOutcome::TRIO) {
        throw std::logic_error {"Reveal sequence does not end in a trio"};
    }
    auto& player = players.at(turnOrder.at(currentTurn));
    const auto first = revealSequence.end() - N_COPIES;
    player.addTrio(CardTrio {first[0].card, first[1].card, first[2].card});
    for (auto iter = first; iter != revealSequence.end(); ++iter) {
        if (const auto* origin = std::get_if<MiddleOrigin>(&iter->origin)) {
            middle.at(origin->slot).state = MiddleCardState::TAKEN;
        }
    }
    revealSequence.clear();
    return numbers.back();
}

std::vector<const Player*> Room::returnRevealedCards()
{
    auto ret = std::vector<const Player*> {};
    for (const auto& entry : revealSequence) {
        if (const auto* origin = std::get_if<MiddleOrigin>(&entry.origin)) {
            middle.at(origin->slot).state = MiddleCardState::FACE_DOWN;
        } else {
            const auto& hand_origin = std::get<HandOrigin>(entry.origin);
            auto& player = dereference(getPlayer(hand_origin.playerId));
            player.returnCard(entry.card);
            if (std::find(ret.begin(), ret.end(), &player) == ret.end()) {
                ret.push_back(&player);
            }
        }
    }
    revealSequence.clear();
    return ret;
}

void Room::advanceTurn()
{
    internalRequirePlaying();
    currentTurn = (currentTurn + 1) % static_cast<int>(turnOrder.size());
    revealSequence.clear();
}

void Room::finish(const std::string_view winnerId, const Win& win)
{
    const auto n = internalIndexOf(winnerId);
    if (n < 0) {
        throw std::invalid_argument {"Winner is not in the room"};
    }
    winner = n;
    this->win = win;
    phase = Phase::FINISHED;
}

const Player* Room::getWinner() const
{
    return winner ? &players.at(*winner) : nullptr;
}

void Room::internalRequirePlaying() const
{
    if (phase == Phase::WAITING) {
        throw PhaseError {"Game has not started"};
    } else if (phase == Phase::FINISHED) {
        throw PhaseError {"Game is over"};
    }
}

int Room::internalIndexOf(const std::string_view playerId) const
{
    const auto iter = std::find_if(
        players.begin(), players.end(),
        [playerId](const auto& player) { return player.getId() == playerId; });
    return iter != players.end() ? static_cast<int>(iter - players.begin()) : -1;
}

std::ostream& operator<<(std::ostream& os, const Phase phase)
{
    return outputEnum(os, phase, PHASE_TO_STRING_MAP.left);
}

std::ostream& operator<<(std::ostream& os, const MiddleOrigin& origin)
{
    return os << "middle slot " << origin.slot;
}

std::ostream& operator<<(std::ostream& os, const HandOrigin& origin)
{
    return os << origin.position << " card of " << origin.playerId;
}

}
}
