#include "engine/WinCondition.hh"

#include "engine/Player.hh"
#include "trio/Connections.hh"
#include "trio/TrioConstants.hh"
#include "IoUtility.hh"

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <sstream>

namespace Trio {
namespace Engine {

namespace {

const auto WIN_REASON_STRING_PAIRS =
    std::initializer_list<WinReasonToStringMap::value_type> {
    { WinReason::SEVEN_TRIO,      "7-trio"          },
    { WinReason::THREE_TRIOS,     "3_trios"         },
    { WinReason::CONNECTED_TRIOS, "connected_trios" },
};

constexpr auto TRIOS_TO_WIN_SIMPLE = 3;

std::optional<std::pair<int, int>> findConnectedPair(
    const std::vector<int>& numbers)
{
    for (auto first = numbers.begin(); first != numbers.end(); ++first) {
        const auto second = std::find_if(
            std::next(first), numbers.end(),
            [a = *first](const auto b) { return numbersConnected(a, b); });
        if (second != numbers.end()) {
            return std::pair {*first, *second};
        }
    }
    return std::nullopt;
}

}

const WinReasonToStringMap WIN_REASON_TO_STRING_MAP(
    WIN_REASON_STRING_PAIRS.begin(), WIN_REASON_STRING_PAIRS.end());

bool operator==(const Win& lhs, const Win& rhs)
{
    return lhs.reason == rhs.reason && lhs.connected == rhs.connected;
}

std::optional<Win> checkWin(const Player& player, const GameMode mode)
{
    const auto numbers = player.getTrioNumbers();
    if (std::find(numbers.begin(), numbers.end(), WINNING_NUMBER) !=
        numbers.end()) {
        return Win {WinReason::SEVEN_TRIO, std::nullopt};
    }
    if (mode == GameMode::SIMPLE) {
        if (std::ssize(numbers) >= TRIOS_TO_WIN_SIMPLE) {
            return Win {WinReason::THREE_TRIOS, std::nullopt};
        }
    } else if (const auto pair = findConnectedPair(numbers)) {
        return Win {WinReason::CONNECTED_TRIOS, pair};
    }
    return std::nullopt;
}

std::string describeWin(const Win& win)
{
    switch (win.reason) {
    case WinReason::SEVEN_TRIO:
        return "Got the legendary 7-7-7 trio!";
    case WinReason::THREE_TRIOS:
        return "Collected 3 trios!";
    case WinReason::CONNECTED_TRIOS:
        break;
    }
    auto out = std::ostringstream {};
    out << "Got 2 connected trios";
    if (win.connected) {
        out << " (" << win.connected->first << " and " <<
            win.connected->second << ")";
    }
    out << "!";
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const WinReason reason)
{
    return outputEnum(os, reason, WIN_REASON_TO_STRING_MAP.left);
}

std::ostream& operator<<(std::ostream& os, const Win& win)
{
    os << win.reason;
    if (win.connected) {
        os << " (" << win.connected->first << ", " << win.connected->second <<
            ")";
    }
    return os;
}

}
}
