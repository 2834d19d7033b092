#include "engine/Player.hh"
#include "trio/Card.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using testing::ElementsAre;

using namespace Trio;
using Engine::CardTrio;
using Engine::Player;

class PlayerTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        player.deal({Card {9, 4}, Card {0, 1}, Card {35, 12}, Card {1, 1}});
    }

    Player player {"abcd1234", "Alice"};
};

TEST_F(PlayerTest, testIdentity)
{
    EXPECT_EQ("abcd1234", player.getId());
    EXPECT_EQ("Alice", player.getName());
    EXPECT_TRUE(player.isConnected());
}

TEST_F(PlayerTest, testDealSortsHand)
{
    EXPECT_THAT(
        player.getHand(),
        ElementsAre(Card {0, 1}, Card {1, 1}, Card {9, 4}, Card {35, 12}));
    EXPECT_EQ(4, player.getNumberOfCards());
    EXPECT_EQ(1, player.getLowestNumber());
    EXPECT_EQ(12, player.getHighestNumber());
}

TEST_F(PlayerTest, testTakeLowest)
{
    EXPECT_EQ(Card(0, 1), player.takeCard(HandPosition::LOWEST));
    EXPECT_EQ(3, player.getNumberOfCards());
}

TEST_F(PlayerTest, testTakeHighest)
{
    EXPECT_EQ(Card(35, 12), player.takeCard(HandPosition::HIGHEST));
    EXPECT_EQ(3, player.getNumberOfCards());
    EXPECT_EQ(4, player.getHighestNumber());
}

TEST_F(PlayerTest, testTakeFromEmptyHand)
{
    player.deal({});
    EXPECT_FALSE(player.takeCard(HandPosition::LOWEST));
    EXPECT_FALSE(player.getLowestNumber());
    EXPECT_FALSE(player.getHighestNumber());
}

TEST_F(PlayerTest, testReturnCardKeepsHandSorted)
{
    const auto card = player.takeCard(HandPosition::HIGHEST);
    ASSERT_TRUE(card);
    player.returnCard(*card);
    const auto low = player.takeCard(HandPosition::LOWEST);
    ASSERT_TRUE(low);
    player.returnCard(*low);
    EXPECT_THAT(
        player.getHand(),
        ElementsAre(Card {0, 1}, Card {1, 1}, Card {9, 4}, Card {35, 12}));
}

TEST_F(PlayerTest, testAddTrio)
{
    player.addTrio(CardTrio {Card {18, 7}, Card {19, 7}, Card {20, 7}});
    EXPECT_EQ(1, player.getNumberOfTrios());
    EXPECT_THAT(player.getTrioNumbers(), ElementsAre(7));
}

TEST_F(PlayerTest, testAddInvalidTrio)
{
    EXPECT_THROW(
        player.addTrio(CardTrio {Card {18, 7}, Card {19, 7}, Card {21, 8}}),
        std::invalid_argument);
    EXPECT_EQ(0, player.getNumberOfTrios());
}

TEST_F(PlayerTest, testDealClearsTrios)
{
    player.addTrio(CardTrio {Card {18, 7}, Card {19, 7}, Card {20, 7}});
    player.deal({Card {2, 1}});
    EXPECT_EQ(0, player.getNumberOfTrios());
}

TEST_F(PlayerTest, testConnected)
{
    player.setConnected(false);
    EXPECT_FALSE(player.isConnected());
}
