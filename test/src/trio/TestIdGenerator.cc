#include "trio/IdGenerator.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>

TEST(IdGeneratorTest, testRoomCode)
{
    const auto code = Trio::generateRoomCode();
    EXPECT_EQ(5u, code.size());
    EXPECT_TRUE(
        std::all_of(
            code.begin(), code.end(),
            [](const unsigned char c)
            {
                return std::isdigit(c) || std::isupper(c);
            }));
}

TEST(IdGeneratorTest, testPlayerId)
{
    const auto id = Trio::generatePlayerId();
    EXPECT_EQ(8u, id.size());
    EXPECT_TRUE(
        std::all_of(
            id.begin(), id.end(),
            [](const unsigned char c)
            {
                return std::isdigit(c) || std::islower(c);
            }));
}
