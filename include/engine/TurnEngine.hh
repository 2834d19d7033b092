/** \file
 *
 * \brief Definition of Trio::Engine::TurnEngine class
 */

#ifndef ENGINE_TURNENGINE_HH_
#define ENGINE_TURNENGINE_HH_

#include "engine/RevealOutcome.hh"
#include "engine/Room.hh"
#include "engine/WinCondition.hh"
#include "trio/Card.hh"
#include "Observer.hh"

#include <boost/core/noncopyable.hpp>
#include <boost/operators.hpp>

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

namespace Trio {

/** \brief The game rules
 *
 * Namespace Engine contains the state of a room and the state machine
 * applying the reveal, trio and fail rules to it.
 */
namespace Engine {

/** \brief The state machine of one Trio game
 *
 * TurnEngine applies the rules of the game to a Room. It accepts reveals
 * from the player having the turn, evaluates the reveal sequence after each
 * card, captures trios, checks the win condition and passes the turn after a
 * failed sequence.
 *
 * Everything that happens is published as notifications. The notifications
 * are emitted synchronously from the method causing them, in the order the
 * clients are expected to see them.
 *
 * A failed reveal sequence is not reverted immediately. The engine stays in
 * a “turn ending” state, where all reveals are rejected, until
 * endFailedTurn() is called. This gives the caller the opportunity to keep
 * the failed cards visible for a while.
 */
class TurnEngine : private boost::noncopyable {
public:

    /** \brief The reason a player got the turn
     */
    enum class TurnKind {
        FIRST,      ///< The game just started
        CONTINUED,  ///< The player captured a trio and continues
        NEXT        ///< The previous player failed
    };

    /** \brief Event for announcing that the game has started
     */
    struct GameStarted : private boost::equality_comparable<GameStarted> {
        /** \brief Create new game started event
         *
         * \param room see \ref room
         */
        explicit GameStarted(const Room& room);

        const Room& room;  ///< The room of the game
    };

    /** \brief Event for announcing that the hand of a player has changed
     */
    struct HandChanged : private boost::equality_comparable<HandChanged> {
        /** \brief Create new hand changed event
         *
         * \param player see \ref player
         */
        explicit HandChanged(const Player& player);

        const Player& player;  ///< The player whose hand changed
    };

    /** \brief Event for announcing that a player has turn
     */
    struct TurnStarted : private boost::equality_comparable<TurnStarted> {
        /** \brief Create new turn started event
         *
         * \param player see \ref player
         * \param kind see \ref kind
         */
        TurnStarted(const Player& player, TurnKind kind);

        const Player& player;  ///< The player having the turn
        TurnKind kind;         ///< Why the player got the turn
    };

    /** \brief Event for announcing that a card was revealed
     */
    struct CardRevealed : private boost::equality_comparable<CardRevealed> {
        /** \brief Create new card revealed event
         *
         * \param revealer see \ref revealer
         * \param entry see \ref entry
         */
        CardRevealed(const Player& revealer, RevealEntry entry);

        const Player& revealer;  ///< The player who revealed the card
        RevealEntry entry;       ///< The card and its origin
    };

    /** \brief Event for announcing that the public state of the game changed
     */
    struct StateChanged : private boost::equality_comparable<StateChanged> {
        /** \brief Create new state changed event
         *
         * \param room see \ref room
         */
        explicit StateChanged(const Room& room);

        const Room& room;  ///< The room of the game
    };

    /** \brief Event for announcing that the revealed cards match so far
     */
    struct RevealMatched : private boost::equality_comparable<RevealMatched> {
        /** \brief Create new reveal matched event
         *
         * \param number see \ref number
         * \param count see \ref count
         */
        RevealMatched(int number, int count);

        int number;  ///< The matching number
        int count;   ///< The length of the reveal sequence
    };

    /** \brief Event for announcing that a trio was captured
     */
    struct TrioCompleted : private boost::equality_comparable<TrioCompleted> {
        /** \brief Create new trio completed event
         *
         * \param player see \ref player
         * \param number see \ref number
         */
        TrioCompleted(const Player& player, int number);

        const Player& player;  ///< The player who captured the trio
        int number;            ///< The number of the trio
    };

    /** \brief Event for announcing that a reveal sequence failed
     *
     * The revealed cards are still out when this notification takes place.
     */
    struct TurnFailed : private boost::equality_comparable<TurnFailed> {
        /** \brief Create new turn failed event
         *
         * \param player see \ref player
         */
        explicit TurnFailed(const Player& player);

        const Player& player;  ///< The player whose turn ends
    };

    /** \brief Event for announcing that the game has ended
     */
    struct GameEnded : private boost::equality_comparable<GameEnded> {
        /** \brief Create new game ended event
         *
         * \param winner see \ref winner
         * \param win see \ref win
         */
        GameEnded(const Player& winner, const Win& win);

        const Player& winner;  ///< The winner
        Win win;               ///< The winning condition
    };

    /** \brief Create new turn engine
     *
     * The game is not started until startGame() is called. The two‐stage
     * initialization allows the client to subscribe to the notifications
     * before the game starts.
     *
     * \param room the room the game is played in
     */
    explicit TurnEngine(std::shared_ptr<Room> room);

    ~TurnEngine();

    /** \brief Subscribe to notifications about the game starting
     *
     * The notification takes place after the cards have been dealt.
     */
    void subscribeToGameStarted(std::weak_ptr<Observer<GameStarted>> observer);

    /** \brief Subscribe to notifications about hands changing
     *
     * Takes place for every player when the game starts and when a trio is
     * captured, for the target of a hand reveal, and for every player getting
     * cards back after a failed sequence.
     */
    void subscribeToHandChanged(std::weak_ptr<Observer<HandChanged>> observer);

    /** \brief Subscribe to notifications about turns starting
     */
    void subscribeToTurnStarted(std::weak_ptr<Observer<TurnStarted>> observer);

    /** \brief Subscribe to notifications about cards being revealed
     *
     * The notification takes place before the sequence is evaluated.
     */
    void subscribeToCardRevealed(
        std::weak_ptr<Observer<CardRevealed>> observer);

    /** \brief Subscribe to notifications about the public state changing
     */
    void subscribeToStateChanged(
        std::weak_ptr<Observer<StateChanged>> observer);

    /** \brief Subscribe to notifications about partial matches
     */
    void subscribeToRevealMatched(
        std::weak_ptr<Observer<RevealMatched>> observer);

    /** \brief Subscribe to notifications about trios being captured
     *
     * The notification takes place after the trio has been moved to the
     * player but before the win condition is checked.
     */
    void subscribeToTrioCompleted(
        std::weak_ptr<Observer<TrioCompleted>> observer);

    /** \brief Subscribe to notifications about failed sequences
     */
    void subscribeToTurnFailed(std::weak_ptr<Observer<TurnFailed>> observer);

    /** \brief Subscribe to notifications about the game ending
     */
    void subscribeToGameEnded(std::weak_ptr<Observer<GameEnded>> observer);

    /** \brief Start the game with a freshly shuffled deck
     *
     * \throw PhaseError if the game has already started
     * \throw CapacityError if the room does not have enough seats
     */
    void startGame();

    /** \brief Start the game with the given deck
     *
     * \param deck the cards dealt, see Room::start()
     *
     * \throw See startGame()
     */
    void startGame(const std::vector<Card>& deck);

    /** \brief Reveal a middle card
     *
     * \warning This function is not reentrant and may not be called from any
     * of the observers.
     *
     * \param actorId the id of the player revealing the card
     * \param cardId the id of the middle card
     *
     * \return the outcome of the reveal sequence after the card
     *
     * \throw PhaseError if the game is not in progress or the turn is ending
     * \throw TurnError if \p actorId does not have the turn
     * \throw TargetError if the card cannot be revealed
     */
    RevealOutcome revealFromMiddle(std::string_view actorId, int cardId);

    /** \brief Reveal the lowest or highest card of a hand
     *
     * \warning This function is not reentrant and may not be called from any
     * of the observers.
     *
     * \param actorId the id of the player revealing the card
     * \param targetId the id of the player whose card is revealed
     * \param position “lowest” or “highest”
     *
     * \return the outcome of the reveal sequence after the card
     *
     * \throw PhaseError if the game is not in progress or the turn is ending
     * \throw TurnError if \p actorId does not have the turn
     * \throw TargetError if \p position is invalid, or the target does not
     * exist or has no cards
     */
    RevealOutcome revealFromPlayer(
        std::string_view actorId, std::string_view targetId,
        std::string_view position);

    /** \brief Return the cards of a failed sequence and pass the turn
     *
     * \throw PhaseError if no failed sequence is pending
     */
    void endFailedTurn();

    /** \brief Determine if a failed sequence waits for endFailedTurn()
     */
    bool isTurnEnding() const;

    /** \brief Determine if the game has ended
     */
    bool hasEnded() const;

    /** \brief Return the room of the game
     */
    const Room& getRoom() const;

    class Impl;

private:

    void internalCheckActor(std::string_view actorId) const;
    RevealOutcome internalProcessReveal(const RevealEntry& entry);

    const std::shared_ptr<Impl> impl;
};

/// \cond DOXYGEN_IGNORE
bool operator==(
    const TurnEngine::GameStarted&, const TurnEngine::GameStarted&);
bool operator==(
    const TurnEngine::HandChanged&, const TurnEngine::HandChanged&);
bool operator==(
    const TurnEngine::TurnStarted&, const TurnEngine::TurnStarted&);
bool operator==(
    const TurnEngine::CardRevealed&, const TurnEngine::CardRevealed&);
bool operator==(
    const TurnEngine::StateChanged&, const TurnEngine::StateChanged&);
bool operator==(
    const TurnEngine::RevealMatched&, const TurnEngine::RevealMatched&);
bool operator==(
    const TurnEngine::TrioCompleted&, const TurnEngine::TrioCompleted&);
bool operator==(
    const TurnEngine::TurnFailed&, const TurnEngine::TurnFailed&);
bool operator==(
    const TurnEngine::GameEnded&, const TurnEngine::GameEnded&);
/// \endcond

/** \brief Output a TurnKind to stream
 */
std::ostream& operator<<(std::ostream& os, TurnEngine::TurnKind kind);

}
}

#endif // ENGINE_TURNENGINE_HH_
