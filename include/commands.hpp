/**
 * @page dgt-commands dgtlink Commands Layer
 * @file commands.hpp
 * @brief Request sequences and response rendering for the host tools.
 *
 * @details
 * PURPOSE
 * -------
 * The core (include/dgtlink/) knows how to turn bytes into typed responses.
 * This layer is what the Linux tools put on top of it:
 *   - Group **requests**: the command sequence behind `--info` and the
 *     reply type each request waits for.
 *   - Render **responses** as compact, shell-friendly `key=value` lines
 *     or as JSON objects for scripts.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **dgtlink/command.hpp**: the Command enum and its byte codec.
 * - **dgtlink/message.hpp**: decode_response() produces the Response rendered here.
 * - **dgtlink/session.hpp**: Session::send() writes the single command byte.
 * - **board_registry.hpp**: checks each port with Session::send(RequestSerialNumber).
 * - **command_dispatch.hpp**: maps CLI names to Command values.
 *
 * OUTPUT FORMATS
 * --------------
 * - pretty: `status=ok type=version version=1.2`
 *   A board dump is followed by eight `row=N squares=RNBKQBNR` lines.
 * - json: one object per response, e.g.
 *   `{"status":"ok","type":"version","major":1,"minor":2,"version":"1.2"}`
 * - raw: the frame bytes in hex (handled by the CLI, not here).
 *
 * EXAMPLE
 * -------
 * @code
 *   session.send(dgtlink::Command::RequestVersion, err);
 *   // ... session.poll(resp, err) ...
 *   std::cout << dgtlink::decode_pretty(resp) << "\n";
 * @endcode
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "dgtlink/command.hpp"
#include "dgtlink/message.hpp"
#include "dgtlink/move_classifier.hpp"

namespace dgtlink {

/**
 * @brief The request sequence behind `--info`.
 *
 * Serial number, bus address, trademark, version, in that order.
 */
std::vector<Command> info_commands();

/**
 * @brief Message type the board answers @p c with.
 *
 * std::nullopt for commands that only change the board's mode
 * (Reset, EnableUpdate, RequestUpdate, RequestNiceUpdate).
 */
std::optional<MessageType> expected_reply(Command c);

/**
 * @brief Render a response as one `key=value` line.
 *
 * Examples:
 *   "status=ok type=clock white=01:30:00 black=01:29:59 turn=white"
 *   "status=ok type=field_update square=12 piece=white_pawn"
 *   "status=ok type=board_dump start=normal pieces=32"
 *
 * Text fields are printed verbatim after lossy decoding.
 */
std::string decode_pretty(const Response& r);

/**
 * @brief Eight `row=N squares=...` lines for a board.
 *
 * Empty squares print as '.', pieces as their FEN letter.
 */
std::vector<std::string> board_rows_pretty(const BoardState& board);

/// Same content as decode_pretty() as a JSON object.
nlohmann::json response_to_json(const Response& r);

/// `{"status":"error","reason":"invalid_length",...}` for a decode failure.
nlohmann::json parse_error_to_json(const ParseError& err);

/**
 * @brief One line for a recognized move.
 *
 * Example: "event=move kind=capture from=12 to=21 piece=white_knight captured=black_pawn"
 * The captured field is omitted when nothing was taken.
 */
std::string move_pretty(const MoveResult& m);

nlohmann::json move_to_json(const MoveResult& m);

/// "hh:mm:ss" with two digits per field.
std::string format_clock_time(const ClockTime& t);

/// Lowercase hex with single spaces: "86 00 05 01 02".
std::string hex_bytes(const std::vector<uint8_t>& bytes);

} // namespace dgtlink
