#pragma once
/**
 * @page dgt-message dgtlink Message Decoder
 * @file message.hpp
 * @brief Turn one framed payload into a typed, validated Response.
 *
 * @details
 * PURPOSE
 * -------
 * The frame reader hands over `(type_code, payload)` pairs with no idea what
 * they mean. This layer knows the per-type schema and either returns exactly
 * one Response or a ParseError that says what was wrong. It never throws and
 * never indexes past the payload; every byte-to-enum step goes through a
 * total lookup that can answer "unrecognized".
 *
 * SCHEMA
 * ------
 * | type          | code | payload | rule                                           |
 * |---------------|------|---------|------------------------------------------------|
 * | BoardDump     | 0x06 | 64      | each byte a piece, else InvalidPiece          |
 * | ClockReading  | 0x0D | 7       | BCD h/m/s white, BCD h/m/s black, status byte  |
 * | FieldUpdate   | 0x0E | 2       | square < 64 else InvalidMove; piece byte       |
 * | EEMoves       | 0x0F | -       | recognized, not decoded: Unsupported           |
 * | BusAddress    | 0x10 | any     | lossy text                                     |
 * | SerialNumber  | 0x11 | any     | lossy text                                     |
 * | Trademark     | 0x12 | any     | lossy text                                     |
 * | Version       | 0x13 | 2       | "major.minor"                                  |
 *
 * Length mismatches produce InvalidLength with both the expected and the
 * actual payload size so a log line alone is enough to diagnose firmware
 * drift.
 *
 * CLOCK STATUS BYTE
 * -----------------
 * bit 0 set         -> NoClock (no clock attached, times meaningless)
 * else bit 3 set    -> BlackToMove
 * else              -> WhiteToMove
 *
 * TEXT FIELDS
 * -----------
 * Serial number, bus address and trademark are informational. They are read
 * as UTF-8; any invalid sequence is replaced with U+FFFD. They never fail.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "dgtlink/board.hpp"

namespace dgtlink {

/// Inbound message type; enumerator values are the low 7 bits of the type byte.
enum class MessageType : uint8_t {
    BoardDump    = 0x06,
    ClockReading = 0x0D,
    FieldUpdate  = 0x0E,
    EEMoves      = 0x0F,
    BusAddress   = 0x10,
    SerialNumber = 0x11,
    Trademark    = 0x12,
    Version      = 0x13
};

/// Total lookup: any code not in the table above is std::nullopt.
std::optional<MessageType> message_type_from_code(uint8_t code);

/// Stable lowercase name ("board_dump", "version", ...).
const char* message_type_name(MessageType t);

// ------------------------------ payloads ------------------------------

/// One side's remaining time, each field 0..99 after BCD decoding.
struct ClockTime {
    uint8_t hours{0};
    uint8_t minutes{0};
    uint8_t seconds{0};
};

enum class TurnStatus : uint8_t { NoClock, WhiteToMove, BlackToMove };

struct BoardDump {
    BoardState board{};
};

struct ClockReading {
    ClockTime  white{};
    ClockTime  black{};
    TurnStatus status{TurnStatus::NoClock};
};

struct FieldUpdate {
    SquareUpdate update{};
};

struct SerialNumber { std::string text; };
struct BusAddress   { std::string text; };
struct Trademark    { std::string text; };

struct VersionInfo {
    uint8_t     major{0};
    uint8_t     minor{0};
    std::string text;   ///< "major.minor" in decimal
};

/// Exactly one alternative is produced per message type.
using Response = std::variant<BoardDump, ClockReading, FieldUpdate,
                              SerialNumber, BusAddress, Trademark, VersionInfo>;

// ------------------------------- errors -------------------------------

enum class ParseErrorKind : uint8_t {
    UnknownMessageType,  ///< code not in the type table
    InvalidLength,       ///< payload size differs from the fixed schema
    InvalidPiece,        ///< a piece byte outside 0x00..0x0C
    InvalidMove,         ///< square index >= 64
    Unsupported          ///< recognized type with no decoder (EEMoves)
};

/**
 * @brief Why a payload did not become a Response.
 *
 * Fields that do not apply to a kind stay at their defaults: expected/actual
 * are only meaningful for InvalidLength, offending for InvalidPiece and
 * InvalidMove.
 */
struct ParseError {
    ParseErrorKind             kind{ParseErrorKind::UnknownMessageType};
    uint8_t                    code{0};          ///< raw type code from the frame
    std::optional<MessageType> message_type;     ///< empty for UnknownMessageType
    std::size_t                expected{0};
    std::size_t                actual{0};
    uint8_t                    offending{0};     ///< bad piece byte or square index
};

const char* parse_error_kind_name(ParseErrorKind k);

/**
 * @brief One-line `reason=... key=value` rendering for logs.
 *
 * Example: "reason=invalid_length type=version expected=2 actual=1"
 */
std::string describe(const ParseError& err);

// ------------------------------ decoding ------------------------------

/// Packed BCD byte to its decimal value: 10 * high nibble + low nibble.
uint8_t bcd_to_int(uint8_t b);

/// Decode three consecutive BCD bytes as hours, minutes, seconds.
ClockTime clock_time_from_bcd(const uint8_t* bcd3);

TurnStatus turn_status_from_byte(uint8_t b);
const char* turn_status_name(TurnStatus s);

/**
 * @brief Interpret bytes as UTF-8, replacing each invalid sequence with U+FFFD.
 *
 * Never fails. Valid input comes back byte-identical.
 */
std::string text_from_bytes_lossy(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode one frame payload.
 *
 * @param code     Low 7 bits of the frame's type byte.
 * @param payload  Frame payload (header bytes already stripped).
 * @param err      Filled when the return value is empty.
 * @return The Response on success, std::nullopt on any ParseError.
 */
std::optional<Response> decode_response(uint8_t code,
                                        const std::vector<uint8_t>& payload,
                                        ParseError& err);

/// Message type that produced a given Response alternative.
MessageType response_type(const Response& r);

} // namespace dgtlink
