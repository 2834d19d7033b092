#include "trio/IdGenerator.hh"

#include "trio/Random.hh"

#include <algorithm>
#include <string_view>

namespace Trio {

namespace {

using namespace std::string_view_literals;

constexpr auto ROOM_CODE_LENGTH = 5;
constexpr auto PLAYER_ID_LENGTH = 8;
constexpr auto ROOM_CODE_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"sv;
constexpr auto PLAYER_ID_CHARS = "abcdefghijklmnopqrstuvwxyz0123456789"sv;

std::string generateFrom(const std::string_view alphabet, const int length)
{
    auto dist = std::uniform_int_distribution<std::size_t> {
        0, alphabet.size() - 1};
    auto ret = std::string(length, ' ');
    std::generate(
        ret.begin(), ret.end(),
        [&dist, alphabet]() { return alphabet[dist(getRng())]; });
    return ret;
}

}

std::string generateRoomCode()
{
    return generateFrom(ROOM_CODE_CHARS, ROOM_CODE_LENGTH);
}

std::string generatePlayerId()
{
    return generateFrom(PLAYER_ID_CHARS, PLAYER_ID_LENGTH);
}

}
