#include "trio/Card.hh"
#include "trio/CardShuffle.hh"
#include "trio/TrioConstants.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>

using Trio::Card;

TEST(CardTest, testAccessors)
{
    const auto card = Card {19, 7};
    EXPECT_EQ(19, card.getId());
    EXPECT_EQ(7, card.getNumber());
}

TEST(CardTest, testInvalidId)
{
    EXPECT_THROW((Card {-1, 1}), std::invalid_argument);
    EXPECT_THROW((Card {Trio::N_CARDS, 1}), std::invalid_argument);
}

TEST(CardTest, testInvalidNumber)
{
    EXPECT_THROW((Card {0, 0}), std::invalid_argument);
    EXPECT_THROW((Card {0, Trio::N_NUMBERS + 1}), std::invalid_argument);
}

TEST(CardTest, testEqualityIsById)
{
    EXPECT_EQ((Card {4, 2}), (Card {4, 2}));
    EXPECT_NE((Card {4, 2}), (Card {5, 2}));
}

TEST(CardTest, testOutput)
{
    auto out = std::ostringstream {};
    out << Card {19, 7};
    EXPECT_EQ("7#19", out.str());
}

TEST(CardShuffleTest, testDeckHasThreeCopiesOfEachNumber)
{
    const auto deck = Trio::generateDeck();
    ASSERT_EQ(Trio::N_CARDS, std::ssize(deck));
    for (auto n = 0; n < Trio::N_CARDS; ++n) {
        EXPECT_EQ(n, deck[n].getId());
        EXPECT_EQ(n / Trio::N_COPIES + 1, deck[n].getNumber());
    }
}

TEST(CardShuffleTest, testShuffledDeckIsPermutationOfDeck)
{
    auto deck = Trio::generateShuffledDeck();
    ASSERT_EQ(Trio::N_CARDS, std::ssize(deck));
    std::sort(
        deck.begin(), deck.end(),
        [](const auto& lhs, const auto& rhs)
        {
            return lhs.getId() < rhs.getId();
        });
    EXPECT_EQ(Trio::generateDeck(), deck);
}

TEST(CardShuffleTest, testShuffledNumbersAreUniformPerPosition)
{
    constexpr auto N_DECKS = 3600;
    constexpr auto EXPECTED = static_cast<double>(N_DECKS) / Trio::N_NUMBERS;
    // chi-square with 11 degrees of freedom, p < 1e-5
    constexpr auto CRITICAL_VALUE = 45.0;
    auto counts = std::array<
        std::array<int, Trio::N_NUMBERS>, Trio::N_CARDS> {};
    for (auto n = 0; n < N_DECKS; ++n) {
        const auto deck = Trio::generateShuffledDeck();
        for (auto position = 0; position < Trio::N_CARDS; ++position) {
            ++counts[position][deck[position].getNumber() - 1];
        }
    }
    for (auto position = 0; position < Trio::N_CARDS; ++position) {
        auto chi_square = 0.0;
        for (const auto count : counts[position]) {
            const auto diff = count - EXPECTED;
            chi_square += diff * diff / EXPECTED;
        }
        EXPECT_LT(chi_square, CRITICAL_VALUE) << "position " << position;
    }
}
