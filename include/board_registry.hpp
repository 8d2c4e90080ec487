#pragma once
/**
 * @page dgt-board-registry dgtlink Board Registry
 * @file board_registry.hpp
 * @brief Find chessboards on the serial ports of this host and remember them.
 *
 * @details
 * PURPOSE
 * -------
 * `dgtlink-cli --scan` answers "which of my USB serial ports is a board, and
 * which board is it?". Every candidate port is opened at the board's link
 * settings and asked for its serial number. A port that answers with a
 * SerialNumber frame is a board.
 *
 * DISCOVERY
 * ---------
 * - Candidates come from /dev/serial/by-id (stable names). When that
 *   directory is missing, /dev/ttyUSB* and /dev/ttyACM* are used instead.
 * - Each candidate is probed with RequestSerialNumber. Up to
 *   PROBE_MAX_FRAMES frames are read looking for the answer, so a board that
 *   is already chatting in update mode is still recognized.
 * - Probing never throws. A port that cannot be opened or stays silent is
 *   listed with online=false.
 *
 * REGISTRY FILE
 * -------------
 * save_registry() writes `$XDG_CONFIG_HOME/dgtlink/boards.json`:
 * @code
 *   [
 *     { "serial": "12345", "dev_path": "/dev/ttyUSB0",
 *       "link": "/dev/serial/by-id/usb-...", "online": true }
 *   ]
 * @endcode
 */

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace dgtlink {

static constexpr int PROBE_TIMEOUT_MS = 1000;   ///< per byte while probing
static constexpr int PROBE_BOOT_MS    = 200;    ///< settle time after open
static constexpr int PROBE_MAX_FRAMES = 4;

/**
 * @brief One serial port seen during discovery.
 */
struct BoardInfo {
    std::string serial;    /**< Serial number text reported by the board; empty when offline. */
    std::string dev_path;  /**< Canonical device path (e.g., "/dev/ttyUSB0"). */
    std::string link;      /**< /dev/serial/by-id symlink, empty for glob fallbacks. */
    bool online{false};    /**< True if the board answered the probe. */
};

/**
 * @brief Ask one port for its serial number.
 *
 * @param dev_path  device to open
 * @param serial    receives the serial number on success
 * @param err       `reason=open_failed`, or the Session reason of the last failure
 * @return true when a SerialNumber frame arrived
 */
bool probe_board(const std::string& dev_path, std::string& serial, std::string& err);

/// Candidate ports as (link, canonical path) pairs; link may be empty.
std::vector<std::pair<std::string, std::string>> candidate_ports();

/// Probe every candidate port.
std::vector<BoardInfo> discover_boards();

nlohmann::json registry_to_json(const std::vector<BoardInfo>& boards);

/// default_config_dir() / "boards.json".
std::filesystem::path default_registry_path();

/**
 * @brief Write the roster to default_registry_path().
 *
 * @param err  the atomic_write_json() reason on failure
 */
bool save_registry(const std::vector<BoardInfo>& boards, std::string& err);

} // namespace dgtlink
