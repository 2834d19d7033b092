#include "trio/Card.hh"

#include "trio/TrioConstants.hh"

#include <ostream>
#include <stdexcept>

namespace Trio {

Card::Card(const int id, const int number) :
    id {id},
    number {number}
{
    if (id < 0 || id >= N_CARDS) {
        throw std::invalid_argument {"Invalid card id"};
    }
    if (number < 1 || number > N_NUMBERS) {
        throw std::invalid_argument {"Invalid card number"};
    }
}

bool operator==(const Card& lhs, const Card& rhs)
{
    return lhs.getId() == rhs.getId();
}

std::ostream& operator<<(std::ostream& os, const Card& card)
{
    return os << card.getNumber() << "#" << card.getId();
}

}
