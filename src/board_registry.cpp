// ============================================================================
// board_registry.cpp - implementation for board_registry.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file board_registry.cpp
 */

#include "board_registry.hpp" // public types and function declarations for the registry layer
#include "settings.hpp"       // default_config_dir(), atomic_write_json()

#include "dgtlink/session.hpp"                       // send/poll over one link
#include "dgtlink/transport/transport_linux_serial.hpp"

#include <glob.h>             // glob(3) for tty fallbacks when /dev/serial/by-id is absent
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
namespace dgtlink {

// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern to a vector of strings.
 * glob() allocates; always globfree().
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}


// -------- public API --------

/*
 * probe_board()
 * -------------
 * Phases:
 *   1) open port at the board's link settings (with boot delay),
 *   2) send RequestSerialNumber,
 *   3) poll a bounded number of frames for the SerialNumber answer,
 *   4) the LinuxSerial destructor closes the port.
 */
bool probe_board(const std::string& dev_path, std::string& serial, std::string& err) {
    transport::SerialConfig cfg;
    cfg.path            = dev_path;
    cfg.read_timeout_ms = PROBE_TIMEOUT_MS;
    cfg.boot_delay_ms   = PROBE_BOOT_MS;

    transport::LinuxSerial link;
    if (!link.begin(cfg)) {
        err = "reason=open_failed";
        return false;
    }

    Session session(link);
    if (!session.send(Command::RequestSerialNumber, err)) return false;

    Response r;
    for (int i = 0; i < PROBE_MAX_FRAMES; ++i) {
        const PollStatus st = session.poll(r, err);
        if (st == PollStatus::IoFailure) return false;
        if (st != PollStatus::Ok) continue;
        if (const auto* sn = std::get_if<SerialNumber>(&r)) {
            serial = sn->text;
            return true;
        }
    }
    err = "reason=no_serial_number";
    return false;
}


/*
 * candidate_ports()
 * -----------------
 * Prefer /dev/serial/by-id symlinks for stability across reboots/ports.
 * If that directory is absent, fall back to globbing tty patterns.
 */
std::vector<std::pair<std::string, std::string>> candidate_ports() {
    std::vector<std::pair<std::string, std::string>> out;
    std::error_code ec;

    const fs::path by_id("/dev/serial/by-id");
    if (fs::is_directory(by_id, ec)) {
        for (const auto& e : fs::directory_iterator(by_id, ec)) {
            if (!e.is_symlink(ec)) continue;
            auto canon = fs::canonical(e.path(), ec);        // don't throw if it fails
            if (!ec) out.emplace_back(e.path().string(), canon.string());
        }
        return out;
    }

    std::vector<std::string> ttys;
    append_glob(ttys, "/dev/ttyUSB*");
    append_glob(ttys, "/dev/ttyACM*");
    for (auto& t : ttys) out.emplace_back(std::string(), t);
    return out;
}


std::vector<BoardInfo> discover_boards() {
    std::vector<BoardInfo> result;
    for (const auto& port : candidate_ports()) {
        BoardInfo info;
        info.link     = port.first;
        info.dev_path = port.second;
        std::string err;
        info.online = probe_board(info.dev_path, info.serial, err);
        result.push_back(info);
    }
    return result;
}


nlohmann::json registry_to_json(const std::vector<BoardInfo>& boards) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& b : boards) {
        nlohmann::json j;
        j["serial"]   = b.serial;
        j["dev_path"] = b.dev_path;
        j["link"]     = b.link;
        j["online"]   = b.online;
        arr.push_back(j);
    }
    return arr;
}


fs::path default_registry_path() {
    return default_config_dir() / "boards.json";
}


bool save_registry(const std::vector<BoardInfo>& boards, std::string& err) {
    return atomic_write_json(default_registry_path(), registry_to_json(boards), err);
}

} // namespace dgtlink
