#include "engine/RevealOutcome.hh"

#include "IoUtility.hh"

#include <initializer_list>
#include <ostream>

namespace Trio {
namespace Engine {

namespace {

const auto REVEAL_OUTCOME_STRING_PAIRS =
    std::initializer_list<RevealOutcomeToStringMap::value_type> {
    { RevealOutcome::PENDING,  "pending"  },
    { RevealOutcome::CONTINUE, "continue" },
    { RevealOutcome::TRIO,     "trio"     },
    { RevealOutcome::FAIL,     "fail"     },
};

}

const RevealOutcomeToStringMap REVEAL_OUTCOME_TO_STRING_MAP(
    REVEAL_OUTCOME_STRING_PAIRS.begin(), REVEAL_OUTCOME_STRING_PAIRS.end());

RevealOutcome evaluateRevealSequence(const std::span<const int> numbers)
{
    const auto n = numbers.size();
    if (n < 2) {
        return RevealOutcome::PENDING;
    }
    const auto last = numbers[n - 1];
    if (n >= 3 && numbers[n - 2] == last && numbers[n - 3] == last) {
        return RevealOutcome::TRIO;
    }
    if (numbers[n - 2] != last) {
        return RevealOutcome::FAIL;
    }
    return RevealOutcome::CONTINUE;
}

std::ostream& operator<<(std::ostream& os, const RevealOutcome outcome)
{
    return outputEnum(os, outcome, REVEAL_OUTCOME_TO_STRING_MAP.left);
}

}
}
