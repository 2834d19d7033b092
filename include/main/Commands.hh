/** \file
 *
 * \brief Definition of \ref trioprotocol commands and events
 *
 * \page trioprotocol Trio protocol
 *
 * This document describes the Trio protocol version 0.1.
 *
 * The key words “MUST”, “MUST NOT”, “REQUIRED”, “SHALL”, “SHALL NOT”, “SHOULD”,
 * “SHOULD NOT”, “RECOMMENDED”, “MAY”, and “OPTIONAL” in this document are to be
 * interpreted as described in RFC 2119 (http://tools.ietf.org/html/rfc2119).
 *
 * \section trioprotocolintro Introduction
 *
 * This document describes a protocol for playing Trio, a card game where the
 * players take turns revealing cards from the middle and from the ends of the
 * hands of the players, trying to find three cards with the same number.
 *
 * The server is the single source of truth for the hidden information and for
 * the legality of the actions. The clients only send actions and render the
 * events they receive.
 *
 * \section trioprotocoltransport Transport
 *
 * The protocol uses ZMTP 3.0 over TCP
 * (https://rfc.zeromq.org/spec:23/ZMTP). The server opens one control socket
 * (ROUTER). A client connects to it with a DEALER (or REQ) socket. The routing
 * id of the connection identifies the client. A client MAY set its routing id
 * explicitly, in which case reconnecting with the same routing id replaces the
 * old connection.
 *
 * \section trioprotocolbasics Basics
 *
 * A Trio protocol \b message is a multipart ZMTP message consisting of a fixed
 * length prefix, followed by a variable number of parameter frames. The
 * parameter frames consist of key/value pairs, with a key frame followed by a
 * serialized value frame. The keys are printable ASCII strings. The values
 * MUST be UTF‐8 encoded JSON documents.
 *
 * \section trioprotocolcontrolmessage Command messages
 *
 * A \b command is a message whose prefix consists of an empty frame, a tag
 * frame and a command identifier frame. The tag MUST NOT contain a colon.
 *
 * \b Example. A command to reveal the lowest card of a player:
 *
 * | N | Content       | Notes                        |
 * |---|---------------|------------------------------|
 * | 1 |               | Empty frame                  |
 * | 2 | MYTAG         | Client chosen tag            |
 * | 3 | reveal_player | Command identifier           |
 * | 4 | target_player_id | Key                       |
 * | 5 | "a1b2c3d4"    | Quotes required (valid JSON) |
 * | 6 | position      | Key                          |
 * | 7 | "lowest"      |                              |
 *
 * Unrecognized arguments are ignored.
 *
 * \section trioprotocolreplymessage Reply messages
 *
 * The server sends a \b reply message to every command. The prefix of a reply
 * consists of an empty frame, the tag frame echoed from the command and a
 * status frame, “OK” or “ERR”. A successful reply MAY be followed by
 * parameter frames.
 *
 * The reply is “ERR” if the command is unknown, a required argument is
 * missing or cannot be deserialized, or the action is not allowed by the
 * rules of the game. In the last case the server also sends the \ref
 * trioprotocoleventerror event describing the reason to the client.
 *
 * \section trioprotocoleventmessage Event messages
 *
 * The server sends \b event messages to the clients seated in a room when the
 * state of the room changes. The prefix of an event message consists of an
 * empty frame and an event frame. The event frame consists of the room code,
 * a colon, and the event type.
 *
 * Some events are broadcast to every connected seat, some are private. Each
 * event carries a \e counter parameter: a running counter increased by one for
 * every event of the room, so that the clients can order the events.
 *
 * A seat whose connection can no longer be reached is marked disconnected.
 * Private events to a disconnected seat are dropped.
 *
 * \section trioprotocolcommands Commands
 *
 * \subsection trioprotocolcommandcreate create
 *
 * - \b Command: create
 * - \b Parameters:
 *   - \e name: the display name of the room
 *   - \e mode (optional): “simple” (default) or “spicy”
 * - \b Reply:
 *   - \e room: the code of the new room
 *
 * \subsection trioprotocolcommandlist list
 *
 * - \b Command: list
 * - \b Parameters: \e none
 * - \b Reply:
 *   - \e rooms: array of the rooms waiting for players and having free seats
 *
 * \subsection trioprotocolcommandjoin join
 *
 * - \b Command: join
 * - \b Parameters:
 *   - \e room: the room code
 *   - \e name: the display name of the player
 * - \b Reply:
 *   - \e player_id: the id of the new seat
 *
 * A connection occupies at most one seat. A room can be joined only while it
 * is waiting and has free seats.
 *
 * \subsection trioprotocolcommandleave leave
 *
 * - \b Command: leave
 * - \b Parameters: \e none
 * - \b Reply: \e none
 *
 * Before the game starts the seat is removed, and a room with no seats left is
 * closed. After that the seat stays and is marked disconnected.
 *
 * \subsection trioprotocolcommandsetmode set_mode
 *
 * - \b Command: set_mode
 * - \b Parameters:
 *   - \e mode: “spicy” (in any case) selects the spicy mode, anything else
 *     the simple mode
 * - \b Reply: \e none
 *
 * \subsection trioprotocolcommandstart start_game
 *
 * - \b Command: start_game
 * - \b Parameters: \e none
 * - \b Reply: \e none
 *
 * \subsection trioprotocolcommandrevealmiddle reveal_middle
 *
 * - \b Command: reveal_middle
 * - \b Parameters:
 *   - \e card_id: the id of a face down middle card
 * - \b Reply:
 *   - \e outcome: “pending”, “continue”, “trio” or “fail”
 *
 * \subsection trioprotocolcommandrevealplayer reveal_player
 *
 * - \b Command: reveal_player
 * - \b Parameters:
 *   - \e target_player_id: the player whose card is revealed
 *   - \e position: “lowest” or “highest”
 * - \b Reply:
 *   - \e outcome: see \ref trioprotocolcommandrevealmiddle
 *
 * The reply to a failed reveal is sent after the revealed cards have been
 * returned.
 *
 * \subsection trioprotocolcommandchat chat
 *
 * - \b Command: chat
 * - \b Parameters:
 *   - \e message: the message broadcast to the room
 * - \b Reply: \e none
 *
 * \section trioprotocolevents Events
 *
 * \subsection trioprotocoleventerror error
 *
 * Private. \e message: the reason an action was rejected.
 *
 * \subsection trioprotocoleventlobby Seating
 *
 * - \e player_joined: \e player, \e room
 * - \e welcome (private): \e player_id, \e room
 * - \e player_disconnected: \e player_id, \e player_name, \e room
 * - \e mode_changed: \e mode, \e room
 * - \e chat: \e player, \e message
 *
 * \subsection trioprotocoleventgame Game
 *
 * - \e game_started: \e mode, \e turn_order, \e current_player, \e
 *   current_player_id, \e middle_card_count, \e room
 * - \e your_hand (private): \e hand
 * - \e your_turn (private): \e message
 * - \e game_state: \e players, \e middle_cards, \e middle_card_count, \e
 *   revealed_this_turn, \e current_player, \e current_player_id
 * - \e card_revealed: \e card, \e source, \e source_id (hand reveals only),
 *   \e position, \e revealed_by, \e show_to_all
 * - \e reveal_match: \e message, \e count
 * - \e trio_complete: \e player, \e player_id, \e trio_number, \e message
 * - \e turn_failed: \e player, \e message, \e delay_return
 * - \e turn_changed: \e current_player, \e current_player_id
 * - \e game_over: \e winner, \e winner_id, \e reason, \e message, \e
 *   final_scores, and \e connected for the spicy win
 */

#ifndef MAIN_COMMANDS_HH_
#define MAIN_COMMANDS_HH_

#include <string_view>

namespace Trio {
namespace Main {

/** \brief See \ref trioprotocolcommandcreate
 */
inline constexpr auto CREATE_COMMAND = std::string_view {"create"};

/** \brief See \ref trioprotocolcommandlist
 */
inline constexpr auto LIST_COMMAND = std::string_view {"list"};

/** \brief See \ref trioprotocolcommandjoin
 */
inline constexpr auto JOIN_COMMAND = std::string_view {"join"};

/** \brief See \ref trioprotocolcommandleave
 */
inline constexpr auto LEAVE_COMMAND = std::string_view {"leave"};

/** \brief See \ref trioprotocolcommandsetmode
 */
inline constexpr auto SET_MODE_COMMAND = std::string_view {"set_mode"};

/** \brief See \ref trioprotocolcommandstart
 */
inline constexpr auto START_GAME_COMMAND = std::string_view {"start_game"};

/** \brief See \ref trioprotocolcommandrevealmiddle
 */
inline constexpr auto REVEAL_MIDDLE_COMMAND =
    std::string_view {"reveal_middle"};

/** \brief See \ref trioprotocolcommandrevealplayer
 */
inline constexpr auto REVEAL_PLAYER_COMMAND =
    std::string_view {"reveal_player"};

/** \brief See \ref trioprotocolcommandchat
 */
inline constexpr auto CHAT_COMMAND = std::string_view {"chat"};

/** \brief See \ref trioprotocolcommandcreate
 */
inline constexpr auto NAME_KEY = std::string_view {"name"};

/** \brief See \ref trioprotocolcommandcreate
 */
inline constexpr auto MODE_KEY = std::string_view {"mode"};

/** \brief See \ref trioprotocolcommandjoin
 */
inline constexpr auto ROOM_KEY = std::string_view {"room"};

/** \brief See \ref trioprotocolcommandlist
 */
inline constexpr auto ROOMS_KEY = std::string_view {"rooms"};

/** \brief See \ref trioprotocolcommandjoin
 */
inline constexpr auto PLAYER_ID_KEY = std::string_view {"player_id"};

/** \brief See \ref trioprotocolcommandrevealmiddle
 */
inline constexpr auto CARD_ID_KEY = std::string_view {"card_id"};

/** \brief See \ref trioprotocolcommandrevealplayer
 */
inline constexpr auto TARGET_PLAYER_ID_KEY =
    std::string_view {"target_player_id"};

/** \brief See \ref trioprotocolcommandrevealplayer
 */
inline constexpr auto POSITION_KEY = std::string_view {"position"};

/** \brief See \ref trioprotocolcommandrevealmiddle
 */
inline constexpr auto OUTCOME_KEY = std::string_view {"outcome"};

/** \brief See \ref trioprotocolcommandchat
 */
inline constexpr auto MESSAGE_KEY = std::string_view {"message"};

/** \brief See \ref trioprotocoleventmessage
 */
inline constexpr auto COUNTER_KEY = std::string_view {"counter"};

/** \brief See \ref trioprotocoleventerror
 */
inline constexpr auto ERROR_EVENT = std::string_view {"error"};

/** \brief See \ref trioprotocoleventlobby
 */
inline constexpr auto WELCOME_EVENT = std::string_view {"welcome"};

/** \brief See \ref trioprotocoleventlobby
 */
inline constexpr auto PLAYER_JOINED_EVENT = std::string_view {"player_joined"};

/** \brief See \ref trioprotocoleventlobby
 */
inline constexpr auto PLAYER_DISCONNECTED_EVENT =
    std::string_view {"player_disconnected"};

/** \brief See \ref trioprotocoleventlobby
 */
inline constexpr auto MODE_CHANGED_EVENT = std::string_view {"mode_changed"};

/** \brief See \ref trioprotocoleventlobby
 */
inline constexpr auto CHAT_EVENT = std::string_view {"chat"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto GAME_STARTED_EVENT = std::string_view {"game_started"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto YOUR_HAND_EVENT = std::string_view {"your_hand"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto YOUR_TURN_EVENT = std::string_view {"your_turn"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto GAME_STATE_EVENT = std::string_view {"game_state"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto CARD_REVEALED_EVENT = std::string_view {"card_revealed"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto REVEAL_MATCH_EVENT = std::string_view {"reveal_match"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto TRIO_COMPLETE_EVENT = std::string_view {"trio_complete"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto TURN_FAILED_EVENT = std::string_view {"turn_failed"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto TURN_CHANGED_EVENT = std::string_view {"turn_changed"};

/** \brief See \ref trioprotocoleventgame
 */
inline constexpr auto GAME_OVER_EVENT = std::string_view {"game_over"};

/// \cond DOXYGEN_IGNORE
inline constexpr auto PLAYER_KEY = std::string_view {"player"};
inline constexpr auto PLAYER_NAME_KEY = std::string_view {"player_name"};
inline constexpr auto TURN_ORDER_KEY = std::string_view {"turn_order"};
inline constexpr auto CURRENT_PLAYER_KEY = std::string_view {"current_player"};
inline constexpr auto CURRENT_PLAYER_ID_KEY =
    std::string_view {"current_player_id"};
inline constexpr auto MIDDLE_CARD_COUNT_KEY =
    std::string_view {"middle_card_count"};
inline constexpr auto HAND_KEY = std::string_view {"hand"};
inline constexpr auto CARD_KEY = std::string_view {"card"};
inline constexpr auto SOURCE_KEY = std::string_view {"source"};
inline constexpr auto SOURCE_ID_KEY = std::string_view {"source_id"};
inline constexpr auto REVEALED_BY_KEY = std::string_view {"revealed_by"};
inline constexpr auto SHOW_TO_ALL_KEY = std::string_view {"show_to_all"};
inline constexpr auto COUNT_KEY = std::string_view {"count"};
inline constexpr auto TRIO_NUMBER_KEY = std::string_view {"trio_number"};
inline constexpr auto DELAY_RETURN_KEY = std::string_view {"delay_return"};
inline constexpr auto WINNER_KEY = std::string_view {"winner"};
inline constexpr auto WINNER_ID_KEY = std::string_view {"winner_id"};
inline constexpr auto REASON_KEY = std::string_view {"reason"};
inline constexpr auto FINAL_SCORES_KEY = std::string_view {"final_scores"};
inline constexpr auto CONNECTED_KEY = std::string_view {"connected"};
inline constexpr auto TRIOS_KEY = std::string_view {"trios"};
/// \endcond

}
}

#endif // MAIN_COMMANDS_HH_
