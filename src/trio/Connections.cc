#include "trio/Connections.hh"

#include "trio/TrioConstants.hh"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

namespace Trio {

namespace {

// Indexed by number - 1
const auto CONNECTIONS = std::array<std::vector<int>, N_NUMBERS> {{
    { 2, 3 },
    { 1, 3, 4 },
    { 1, 2, 4, 5 },
    { 2, 3, 5, 6 },
    { 3, 4, 6, 7 },
    { 4, 5, 7, 8 },
    { 5, 6, 8, 9 },
    { 6, 7, 9, 10 },
    { 7, 8, 10, 11 },
    { 8, 9, 11, 12 },
    { 9, 10, 12 },
    { 10, 11 },
}};

}

std::span<const int> connectedNumbers(const int number)
{
    if (number < 1 || number > N_NUMBERS) {
        throw std::out_of_range {"Card number out of range"};
    }
    return CONNECTIONS[number - 1];
}

bool numbersConnected(const int a, const int b)
{
    const auto connected = connectedNumbers(a);
    return std::find(connected.begin(), connected.end(), b) != connected.end();
}

}
