/** \file
 *
 * \brief Definition of Trio::Engine::Room class
 */

#ifndef ENGINE_ROOM_HH_
#define ENGINE_ROOM_HH_

#include "engine/Player.hh"
#include "engine/WinCondition.hh"
#include "trio/Card.hh"
#include "trio/GameMode.hh"
#include "trio/HandPosition.hh"
#include "trio/TrioConstants.hh"

#include <boost/bimap/bimap.hpp>
#include <boost/core/noncopyable.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Trio {
namespace Engine {

/** \brief Phase of a room
 *
 * The phases are entered in order and Phase::FINISHED is terminal.
 */
enum class Phase {
    WAITING,  ///< Seats can be taken and the mode changed
    PLAYING,  ///< The game is in progress
    FINISHED  ///< The game has a winner
};

/** \brief Type of \ref PHASE_TO_STRING_MAP
 */
using PhaseToStringMap = boost::bimaps::bimap<Phase, std::string>;

/** \brief Two‐way map between Phase enumerations and their string
 * representation
 */
extern const PhaseToStringMap PHASE_TO_STRING_MAP;

/** \brief Visibility of a card in the middle
 */
enum class MiddleCardState {
    FACE_DOWN,  ///< Hidden, can be revealed
    FACE_UP,    ///< Revealed during the current turn
    TAKEN       ///< Captured in a trio, the slot stays empty
};

/** \brief A slot of the middle pile
 */
struct MiddleSlot {
    Card card;              ///< The card dealt to the slot
    MiddleCardState state;  ///< The visibility of the card
};

/** \brief Origin of a revealed card in the middle pile
 */
struct MiddleOrigin {
    int slot;  ///< Index of the middle slot
};

/** \brief Origin of a revealed card in a hand
 */
struct HandOrigin {
    std::string playerId;   ///< The player the card was taken from
    HandPosition position;  ///< The end of the hand the card was taken from
};

/** \brief Where a revealed card came from
 */
using RevealOrigin = std::variant<MiddleOrigin, HandOrigin>;

/** \brief A card exposed during the current reveal sequence
 */
struct RevealEntry {
    Card card;            ///< The revealed card
    RevealOrigin origin;  ///< Where the card is returned on failure
};

/// \cond DOXYGEN_IGNORE
bool operator==(const MiddleOrigin& lhs, const MiddleOrigin& rhs);
bool operator==(const HandOrigin& lhs, const HandOrigin& rhs);
bool operator==(const RevealEntry& lhs, const RevealEntry& rhs);
/// \endcond

/** \brief Return the number of cards dealt to each hand
 *
 * \param nPlayers the number of seats
 *
 * \return 9, 7, 6 and 5 for 3, 4, 5 and 6 seats, respectively, 5 otherwise
 */
int getHandSize(int nPlayers);

/** \brief Return the number of cards dealt to the middle
 *
 * \param nPlayers the number of seats
 *
 * \return 9, 8, 6 and 6 for 3, 4, 5 and 6 seats, respectively, 6 otherwise
 */
int getMiddleSize(int nPlayers);

/** \brief The authoritative state of one game
 *
 * Room holds the seats, the middle pile, the turn pointer and the reveal
 * sequence. It enforces the invariants of the individual operations, but the
 * turn logic (whose reveal is accepted, what happens after it) lives in
 * TurnEngine.
 *
 * The players are kept in the order they joined. The turn order is decided
 * when the game starts and does not change after that.
 *
 * All mutating methods that throw GameError do so before mutating anything.
 */
class Room : private boost::noncopyable {
public:

    /** \brief Create an empty room in Phase::WAITING
     *
     * \param code the room code
     * \param name the display name
     * \param mode the initial game mode
     * \param minPlayers the minimum number of seats to start
     * \param maxPlayers the maximum number of seats
     *
     * \throw std::invalid_argument unless MIN_PLAYERS <= \p minPlayers <= \p
     * maxPlayers <= MAX_PLAYERS
     */
    Room(
        std::string code, std::string name, GameMode mode,
        int minPlayers = MIN_PLAYERS, int maxPlayers = MAX_PLAYERS);

    const std::string& getCode() const { return code; }
    const std::string& getName() const { return name; }
    GameMode getMode() const { return mode; }
    Phase getPhase() const { return phase; }
    int getMinPlayers() const { return minPlayers; }
    int getMaxPlayers() const { return maxPlayers; }

    /** \brief Return the number of seats
     */
    int getNumberOfPlayers() const;

    /** \brief Determine if the room is waiting and has a free seat
     */
    bool isJoinable() const;

    /** \brief Add a seat
     *
     * \param playerId the id of the new player, unique within the room
     * \param playerName the display name of the new player
     *
     * \return reference to the new player
     *
     * \throw CapacityError if the room is full
     * \throw PhaseError if the game has already started
     * \throw std::invalid_argument if \p playerId is already seated
     */
    const Player& join(std::string playerId, std::string playerName);

    /** \brief Leave the room
     *
     * While waiting the seat is removed. Otherwise the seat stays and is
     * marked disconnected.
     *
     * \param playerId the id of the player leaving
     *
     * \return true if the seat was removed, false otherwise
     */
    bool leave(std::string_view playerId);

    /** \brief Change the game mode
     *
     * \throw PhaseError if the game has already started
     */
    void setMode(GameMode mode);

    /** \brief Start the game
     *
     * Shuffles the turn order, deals the hands in join order from the front
     * of \p deck and puts the next cards face down to the middle. The first
     * player in the turn order gets the turn.
     *
     * \param deck the cards to deal
     *
     * \throw PhaseError if the game has already started
     * \throw CapacityError if there are fewer seats than getMinPlayers()
     * \throw std::invalid_argument if \p deck does not have enough cards
     */
    void start(const std::vector<Card>& deck);

    /** \brief Return the players in join order
     */
    const std::vector<Player>& getPlayers() const { return players; }

    /** \brief Find player by id
     *
     * \return pointer to the player, or nullptr if there is no such player
     */
    const Player* getPlayer(std::string_view playerId) const;

    /// \copydoc getPlayer(std::string_view) const
    Player* getPlayer(std::string_view playerId);

    /** \brief Return the players in turn order
     *
     * Empty until the game starts.
     */
    std::vector<const Player*> getTurnOrder() const;

    /** \brief Return the player having the turn
     *
     * \return pointer to the player, or nullptr unless the game is in
     * Phase::PLAYING
     */
    const Player* getCurrentPlayer() const;

    /** \brief Return the middle pile
     */
    const std::vector<MiddleSlot>& getMiddle() const { return middle; }

    /** \brief Return the number of face down middle cards
     */
    int getNumberOfFaceDownCards() const;

    /** \brief Return the current reveal sequence
     */
    const std::vector<RevealEntry>& getRevealSequence() const
    {
        return revealSequence;
    }

    /** \brief Return the numbers of the current reveal sequence
     */
    std::vector<int> getRevealedNumbers() const;

    /** \brief Turn a middle card face up
     *
     * \param cardId the id of the card
     *
     * \return the new entry of the reveal sequence
     *
     * \throw PhaseError if the game is not in Phase::PLAYING
     * \throw TargetError if the card is not in the middle or is not face down
     */
    const RevealEntry& revealFromMiddle(int cardId);

    /** \brief Take the lowest or highest card from a hand
     *
     * \param targetId the id of the player whose card is revealed
     * \param position the end of the hand
     *
     * \return the new entry of the reveal sequence
     *
     * \throw PhaseError if the game is not in Phase::PLAYING
     * \throw TargetError if the player does not exist or has no cards
     */
    const RevealEntry& revealFromPlayer(
        std::string_view targetId, HandPosition position);

    /** \brief Give the revealed trio to the current player
     *
     * The middle slots of the trio become MiddleCardState::TAKEN and the
     * reveal sequence is cleared.
     *
     * \return the number of the trio
     *
     * \throw std::logic_error if the sequence does not end in a trio
     */
    int captureTrio();

    /** \brief Return the revealed cards to where they came from
     *
     * Middle cards are flipped face down and hand cards are returned to their
     * hands. The reveal sequence is cleared.
     *
     * \return the players who got cards back, each once, in reveal order
     */
    std::vector<const Player*> returnRevealedCards();

    /** \brief Give the turn to the next player in turn order
     *
     * \throw PhaseError if the game is not in Phase::PLAYING
     */
    void advanceTurn();

    /** \brief End the game
     *
     * \param winnerId the id of the winner
     * \param win the winning condition
     *
     * \throw std::invalid_argument if there is no player \p winnerId
     */
    void finish(std::string_view winnerId, const Win& win);

    /** \brief Return the winner, or nullptr if the game has not finished
     */
    const Player* getWinner() const;

    /** \brief Return the winning condition, or none if the game has not
     * finished
     */
    const std::optional<Win>& getWin() const { return win; }

private:

    void internalRequirePlaying() const;
    int internalIndexOf(std::string_view playerId) const;

    std::string code;
    std::string name;
    GameMode mode;
    int minPlayers;
    int maxPlayers;
    Phase phase {Phase::WAITING};
    std::vector<Player> players;
    std::vector<int> turnOrder;
    int currentTurn {0};
    std::vector<MiddleSlot> middle;
    std::vector<RevealEntry> revealSequence;
    std::optional<int> winner;
    std::optional<Win> win;
};

/** \brief Output a Phase to stream
 */
std::ostream& operator<<(std::ostream& os, Phase phase);

/** \brief Output a MiddleOrigin to stream
 */
std::ostream& operator<<(std::ostream& os, const MiddleOrigin& origin);

/** \brief Output a HandOrigin to stream
 */
std::ostream& operator<<(std::ostream& os, const HandOrigin& origin);

}
}

#endif // ENGINE_ROOM_HH_
