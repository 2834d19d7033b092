#include "engine/Player.hh"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace Trio {
namespace Engine {

Player::Player(std::string id, std::string name) :
    id {std::move(id)},
    name {std::move(name)}
{
}

std::vector<int> Player::getTrioNumbers() const
{
    auto ret = std::vector<int> {};
    ret.reserve(trios.size());
    for (const auto& trio : trios) {
        ret.push_back(trio.front().getNumber());
    }
    return ret;
}

int Player::getNumberOfCards() const
{
    return static_cast<int>(hand.size());
}

int Player::getNumberOfTrios() const
{
    return static_cast<int>(trios.size());
}

std::optional<int> Player::getLowestNumber() const
{
    if (hand.empty()) {
        return std::nullopt;
    }
    return hand.front().getNumber();
}

std::optional<int> Player::getHighestNumber() const
{
    if (hand.empty()) {
        return std::nullopt;
    }
    return hand.back().getNumber();
}

void Player::setConnected(const bool connected)
{
    this->connected = connected;
}

void Player::deal(std::vector<Card> cards)
{
    hand = std::move(cards);
    trios.clear();
    sortHand();
}

std::optional<Card> Player::takeCard(const HandPosition position)
{
    if (hand.empty()) {
        return std::nullopt;
    }
    if (position == HandPosition::LOWEST) {
        const auto card = hand.front();
        hand.erase(hand.begin());
        return card;
    }
    const auto card = hand.back();
    hand.pop_back();
    return card;
}

void Player::returnCard(const Card& card)
{
    hand.push_back(card);
    sortHand();
}

void Player::addTrio(const CardTrio& trio)
{
    const auto number = trio.front().getNumber();
    const auto same_number = std::all_of(
        trio.begin(), trio.end(),
        [number](const auto& card) { return card.getNumber() == number; });
    if (!same_number) {
        throw std::invalid_argument {"Cards of a trio must share the number"};
    }
    trios.push_back(trio);
}

void Player::sortHand()
{
    std::sort(
        hand.begin(), hand.end(),
        [](const auto& lhs, const auto& rhs)
        {
            return std::tuple {lhs.getNumber(), lhs.getId()} <
                std::tuple {rhs.getNumber(), rhs.getId()};
        });
}

}
}
