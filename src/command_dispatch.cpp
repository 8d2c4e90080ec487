/**
 * @file command_dispatch.cpp
 * @brief CLI name resolution for dgtlink commands.
 *
 * See command_dispatch.hpp for the name table.
 */

#include "command_dispatch.hpp"

#include <cctype>               // std::tolower


namespace dgtlink {

// ---------- normalizer ----------
// Lowercase char by char and fold '_' into '-'.
// Cast to unsigned char first so std::tolower is well-defined.
static std::string normalize(std::string s) {
    for (char& c : s) {
        c = (char)std::tolower((unsigned char)c);
        if (c == '_') c = '-';
    }
    return s;
}


// ---------- mapping: name -> Command ----------
// Explicit branches rather than a table so every synonym is grep-able.
bool name_to_command(const std::string& raw_name, Command& out, std::string& err) {
    const std::string name = normalize(raw_name);

    // Mode changes
    if (name == "reset")                                   { out = Command::Reset;               return true; }
    if (name == "update" || name == "enable-update")       { out = Command::EnableUpdate;        return true; }

    // Board state
    if (name == "board" || name == "dump" || name == "request-board")
                                                           { out = Command::RequestBoard;        return true; }
    if (name == "update-board" || name == "request-update"){ out = Command::RequestUpdate;       return true; }
    if (name == "update-nice" || name == "nice-update")    { out = Command::RequestNiceUpdate;   return true; }
    if (name == "ee-moves" || name == "eemoves")           { out = Command::RequestEEMoves;      return true; }

    // Clock
    if (name == "clock" || name == "request-clock")        { out = Command::RequestClock;        return true; }

    // Identity / inventory
    if (name == "serial" || name == "serial-number" || name == "sn")
                                                           { out = Command::RequestSerialNumber; return true; }
    if (name == "bus-address" || name == "bus" || name == "address")
                                                           { out = Command::RequestBusAddress;   return true; }
    if (name == "trademark" || name == "tm")               { out = Command::RequestTrademark;    return true; }
    if (name == "version" || name == "ver")                { out = Command::RequestVersion;      return true; }

    err = "unknown_command:" + raw_name;
    return false;
}


bool names_to_commands(const std::vector<std::string>& names,
                       std::vector<Command>& out, std::string& err) {
    out.clear();
    for (const auto& n : names) {
        Command c;
        if (!name_to_command(n, c, err)) return false;
        out.push_back(c);
    }
    return true;
}


const char* command_cli_name(Command c) {
    switch (c) {
        case Command::Reset:               return "reset";
        case Command::RequestClock:        return "clock";
        case Command::RequestBoard:        return "board";
        case Command::EnableUpdate:        return "update";
        case Command::RequestUpdate:       return "update-board";
        case Command::RequestSerialNumber: return "serial";
        case Command::RequestBusAddress:   return "bus-address";
        case Command::RequestTrademark:    return "trademark";
        case Command::RequestEEMoves:      return "ee-moves";
        case Command::RequestNiceUpdate:   return "update-nice";
        case Command::RequestVersion:      return "version";
    }
    return "unknown";
}

} // namespace dgtlink
