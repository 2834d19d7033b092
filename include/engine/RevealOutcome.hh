/** \file
 *
 * \brief Evaluation of a reveal sequence
 */

#ifndef ENGINE_REVEALOUTCOME_HH_
#define ENGINE_REVEALOUTCOME_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <span>
#include <string>

namespace Trio {
namespace Engine {

/** \brief The decision after a card has been revealed
 */
enum class RevealOutcome {
    PENDING,   ///< Fewer than two cards revealed, no decision yet
    CONTINUE,  ///< The revealed cards match so far
    TRIO,      ///< The last three revealed cards form a trio
    FAIL       ///< The last two revealed cards differ, the turn ends
};

/** \brief Type of \ref REVEAL_OUTCOME_TO_STRING_MAP
 */
using RevealOutcomeToStringMap = boost::bimaps::bimap<RevealOutcome, std::string>;

/** \brief Two‐way map between RevealOutcome enumerations and their string
 * representation
 */
extern const RevealOutcomeToStringMap REVEAL_OUTCOME_TO_STRING_MAP;

/** \brief Decide the outcome of a reveal sequence
 *
 * The rules are applied in order:
 *
 * 1. Fewer than two numbers: RevealOutcome::PENDING
 * 2. The last three numbers are equal: RevealOutcome::TRIO
 * 3. The last two numbers differ: RevealOutcome::FAIL
 * 4. Otherwise: RevealOutcome::CONTINUE
 *
 * \param numbers the numbers of the revealed cards in reveal order
 *
 * \return the outcome
 */
RevealOutcome evaluateRevealSequence(std::span<const int> numbers);

/** \brief Output a RevealOutcome to stream
 */
std::ostream& operator<<(std::ostream& os, RevealOutcome outcome);

}
}

#endif // ENGINE_REVEALOUTCOME_HH_
