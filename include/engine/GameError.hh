/** \file
 *
 * \brief Definition of the exceptions for rejected game actions
 */

#ifndef ENGINE_GAMEERROR_HH_
#define ENGINE_GAMEERROR_HH_

#include <stdexcept>

namespace Trio {
namespace Engine {

/** \brief Base class of the exceptions for rejected game actions
 *
 * A GameError is thrown before any state is mutated. The message is meant to
 * be shown to the player whose action was rejected.
 */
class GameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief The action is not allowed in the current phase of the room
 */
class PhaseError : public GameError {
public:
    using GameError::GameError;
};

/** \brief The actor does not have the turn
 */
class TurnError : public GameError {
public:
    using GameError::GameError;
};

/** \brief A card, seat or hand position does not exist or is not available
 */
class TargetError : public GameError {
public:
    using GameError::GameError;
};

/** \brief The room has too many or too few seats for the action
 */
class CapacityError : public GameError {
public:
    using GameError::GameError;
};

}
}

#endif // ENGINE_GAMEERROR_HH_
