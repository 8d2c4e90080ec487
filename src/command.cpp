#include "dgtlink/command.hpp"

namespace dgtlink {

const Command ALL_COMMANDS[COMMAND_COUNT] = {
    Command::Reset,
    Command::RequestClock,
    Command::RequestBoard,
    Command::EnableUpdate,
    Command::RequestUpdate,
    Command::RequestSerialNumber,
    Command::RequestBusAddress,
    Command::RequestTrademark,
    Command::RequestEEMoves,
    Command::RequestNiceUpdate,
    Command::RequestVersion
};


uint8_t command_to_byte(Command c) {
    return static_cast<uint8_t>(c);
}


std::optional<Command> command_from_byte(uint8_t b) {
    switch (b) {
        case 0x40: return Command::Reset;
        case 0x41: return Command::RequestClock;
        case 0x42: return Command::RequestBoard;
        case 0x43: return Command::EnableUpdate;
        case 0x44: return Command::RequestUpdate;
        case 0x45: return Command::RequestSerialNumber;
        case 0x46: return Command::RequestBusAddress;
        case 0x47: return Command::RequestTrademark;
        case 0x49: return Command::RequestEEMoves;
        case 0x4B: return Command::RequestNiceUpdate;
        case 0x4D: return Command::RequestVersion;
        default:   return std::nullopt;
    }
}


const char* command_name(Command c) {
    switch (c) {
        case Command::Reset:               return "reset";
        case Command::RequestClock:        return "request_clock";
        case Command::RequestBoard:        return "request_board";
        case Command::EnableUpdate:        return "enable_update";
        case Command::RequestUpdate:       return "request_update";
        case Command::RequestSerialNumber: return "request_serial_number";
        case Command::RequestBusAddress:   return "request_bus_address";
        case Command::RequestTrademark:    return "request_trademark";
        case Command::RequestEEMoves:      return "request_ee_moves";
        case Command::RequestNiceUpdate:   return "request_nice_update";
        case Command::RequestVersion:      return "request_version";
    }
    return "unknown";
}

} // namespace dgtlink
