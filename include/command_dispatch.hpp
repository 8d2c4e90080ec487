#pragma once
/**
 * @page dgt-command-dispatch dgtlink Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Resolution of user-facing command names to Command values.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between CLI arguments (`--cmd board`) and the
 * command codec. main.cpp never spells out wire bytes; it asks here.
 *
 * NAMES
 * -----
 * | name            | synonyms                         | Command             |
 * |-----------------|----------------------------------|---------------------|
 * | reset           |                                  | Reset               |
 * | clock           | request-clock                    | RequestClock        |
 * | board           | dump, request-board              | RequestBoard        |
 * | update          | enable-update                    | EnableUpdate        |
 * | update-board    | request-update                   | RequestUpdate       |
 * | serial          | serial-number, sn                | RequestSerialNumber |
 * | bus-address     | bus, address                     | RequestBusAddress   |
 * | trademark       | tm                               | RequestTrademark    |
 * | ee-moves        | eemoves                          | RequestEEMoves      |
 * | update-nice     | nice-update                      | RequestNiceUpdate   |
 * | version         | ver                              | RequestVersion      |
 *
 * Matching ignores case, and '_' is accepted in place of '-'.
 *
 * ERRORS
 * ------
 * An unknown name fails with `err = "unknown_command:<name>"`, where <name>
 * is the text as the user typed it.
 */

#include <string>
#include <vector>

#include "dgtlink/command.hpp"

namespace dgtlink {

/**
 * @brief Map a user-facing name to a Command.
 *
 * @param name  e.g. "board", "Bus_Address"
 * @param out   set on success
 * @param err   set on failure
 * @return true on success
 */
bool name_to_command(const std::string& name, Command& out, std::string& err);

/**
 * @brief Resolve a list of names in order.
 *
 * Stops at the first unknown name; @p out then holds the commands resolved
 * before it.
 */
bool names_to_commands(const std::vector<std::string>& names,
                       std::vector<Command>& out, std::string& err);

/// Canonical CLI name of a command ("board", "bus-address", ...).
const char* command_cli_name(Command c);

} // namespace dgtlink
