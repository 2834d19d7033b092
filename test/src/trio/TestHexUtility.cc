#include "HexUtility.hh"
#include "Blob.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace Trio::BlobLiterals;

namespace {

const auto ROUTING_ID = "\x00\x6b\x8b\x45\x67"_BS;
const auto ROUTING_ID_HEX = std::string {"006b8b4567"};

}

TEST(HexUtilityTest, testToHex)
{
    EXPECT_EQ(ROUTING_ID_HEX, Trio::toHex(ROUTING_ID));
}

TEST(HexUtilityTest, testEmpty)
{
    EXPECT_EQ(std::string {}, Trio::toHex(""_BS));
}

TEST(HexUtilityTest, testFormatHex)
{
    std::ostringstream os;
    os << Trio::formatHex(ROUTING_ID);
    EXPECT_EQ(ROUTING_ID_HEX, os.str());
}
