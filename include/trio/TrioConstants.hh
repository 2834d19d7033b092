/** \file
 *
 * \brief Definition of fundamental constants of the Trio game
 */

#ifndef TRIO_TRIOCONSTANTS_HH_
#define TRIO_TRIOCONSTANTS_HH_

/** \brief Top level namespace of the Trio server
 *
 * The Trio namespace directly contains the card model of the game. Game
 * rules, messaging, coroutines and the server application live in
 * subnamespaces.
 */
namespace Trio {

/** \brief Number of distinct card numbers (1-12)
 */
constexpr auto N_NUMBERS = 12;

/** \brief Number of copies of each number in the deck
 *
 * This is also the size of a trio.
 */
constexpr auto N_COPIES = 3;

/** \brief Number of cards in the deck
 */
constexpr auto N_CARDS = N_NUMBERS * N_COPIES; // 36

/** \brief The number whose trio wins regardless of the game mode
 */
constexpr auto WINNING_NUMBER = 7;

/** \brief The least number of seats a game can start with
 */
constexpr auto MIN_PLAYERS = 3;

/** \brief The greatest number of seats in a room
 */
constexpr auto MAX_PLAYERS = 6;

}

#endif // TRIO_TRIOCONSTANTS_HH_
