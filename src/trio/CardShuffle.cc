#include "trio/CardShuffle.hh"

#include "trio/Random.hh"
#include "trio/TrioConstants.hh"

#include <algorithm>

namespace Trio {

std::vector<Card> generateDeck()
{
    auto cards = std::vector<Card> {};
    cards.reserve(N_CARDS);
    for (auto id = 0; id < N_CARDS; ++id) {
        cards.emplace_back(id, id / N_COPIES + 1);
    }
    return cards;
}

std::vector<Card> generateShuffledDeck()
{
    auto cards = generateDeck();
    std::shuffle(cards.begin(), cards.end(), getRng());
    return cards;
}

}
