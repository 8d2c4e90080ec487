#pragma once
/**
 * @file command.hpp
 * @brief Command codec: the eleven single-byte requests the host can send.
 *
 * @details
 * A command on the wire is exactly one byte with no framing. The board answers
 * some commands with a framed message (see frame.hpp) and others only change
 * its mode (Reset, EnableUpdate).
 *
 * @code
 *   0x40 Reset                0x41 RequestClock        0x42 RequestBoard
 *   0x43 EnableUpdate         0x44 RequestUpdate       0x45 RequestSerialNumber
 *   0x46 RequestBusAddress    0x47 RequestTrademark    0x49 RequestEEMoves
 *   0x4B RequestNiceUpdate    0x4D RequestVersion
 * @endcode
 *
 * command_from_byte() is total: every other byte is std::nullopt.
 */

#include <cstdint>
#include <optional>

namespace dgtlink {

enum class Command : uint8_t {
    Reset               = 0x40,
    RequestClock        = 0x41,
    RequestBoard        = 0x42,
    EnableUpdate        = 0x43,
    RequestUpdate       = 0x44,
    RequestSerialNumber = 0x45,
    RequestBusAddress   = 0x46,
    RequestTrademark    = 0x47,
    RequestEEMoves      = 0x49,
    RequestNiceUpdate   = 0x4B,
    RequestVersion      = 0x4D
};

static constexpr int COMMAND_COUNT = 11;

/// Every command in wire order; handy for loops in tools and tests.
extern const Command ALL_COMMANDS[COMMAND_COUNT];

uint8_t command_to_byte(Command c);

std::optional<Command> command_from_byte(uint8_t b);

/// Stable lowercase name for logs ("request_board", ...).
const char* command_name(Command c);

} // namespace dgtlink
