#include "settings.hpp"

#include <cstdlib>            // getenv for XDG/HOME lookups
#include <cstdint>
#include <fstream>            // std::ifstream / std::ofstream for the JSON file
#include <limits>
#include <optional>
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dgtlink {

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Pretty: return "pretty";
        case OutputFormat::Json:   return "json";
        case OutputFormat::Raw:    return "raw";
    }
    return "pretty";
}


std::optional<OutputFormat> output_format_from_name(const std::string& name) {
    if (name == "pretty") return OutputFormat::Pretty;
    if (name == "json")   return OutputFormat::Json;
    if (name == "raw")    return OutputFormat::Raw;
    return std::nullopt;
}


// ---------------------------------------------------------------------------
// Paths: XDG first, then ~/.config.
// ---------------------------------------------------------------------------
fs::path default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "dgtlink";
    const char* home = std::getenv("HOME");
    fs::path base = (home && *home) ? fs::path(home) / ".config" : fs::path(".config");
    return base / "dgtlink";
}


fs::path default_config_path() {
    return default_config_dir() / "config.json";
}


// ---------------------------------------------------------------------------
// JSON <-> Settings
// Each key is checked on its own so one bad value never hides the others.
// ---------------------------------------------------------------------------
// Integer that fits in an int, or nothing. get<int>() would wrap larger values.
static std::optional<int> json_int(const json& v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        const auto i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(i);
    }
    return std::nullopt;
}

bool settings_from_json(const json& j, Settings& s, std::vector<std::string>& warnings) {
    if (!j.is_object()) return false;

    if (auto it = j.find("dev"); it != j.end()) {
        if (it->is_string()) s.dev = it->get<std::string>();
        else warnings.push_back("bad_value:dev");
    }

    if (auto it = j.find("baud"); it != j.end()) {
        const auto baud = json_int(*it);
        if (baud && is_supported_baud(*baud)) s.baud = *baud;
        else warnings.push_back("bad_value:baud");
    }

    if (auto it = j.find("timeout_ms"); it != j.end()) {
        const auto timeout = json_int(*it);
        if (timeout && *timeout > 0 && *timeout <= MAX_TIMEOUT_MS)
            s.timeout_ms = *timeout;
        else
            warnings.push_back("bad_value:timeout_ms");
    }

    if (auto it = j.find("flow_control"); it != j.end()) {
        if (it->is_boolean()) s.flow_control = it->get<bool>();
        else warnings.push_back("bad_value:flow_control");
    }

    if (auto it = j.find("format"); it != j.end()) {
        std::optional<OutputFormat> f;
        if (it->is_string()) f = output_format_from_name(it->get<std::string>());
        if (f) s.format = *f;
        else warnings.push_back("bad_value:format");
    }
    return true;
}


json settings_to_json(const Settings& s) {
    json j;
    j["dev"]          = s.dev;
    j["baud"]         = s.baud;
    j["timeout_ms"]   = s.timeout_ms;
    j["flow_control"] = s.flow_control;
    j["format"]       = output_format_name(s.format);
    return j;
}


// ---------------------------------------------------------------------------
// File I/O
// ---------------------------------------------------------------------------
bool load_settings(const fs::path& path, Settings& s,
                   std::vector<std::string>& warnings, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;

    std::ifstream in(path);
    if (!in) { err = "config_unreadable"; return false; }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        err = std::string("config_parse:byte_") + std::to_string(e.byte);
        return false;
    }

    if (!settings_from_json(j, s, warnings)) {
        err = "config_not_object";
        return false;
    }
    return true;
}


bool atomic_write_json(const fs::path& path, const json& j, std::string& err) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) { err = "mkdir:" + ec.message(); return false; }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) { err = "write_open"; return false; }
        out << j.dump(2) << "\n";
        out.flush();
        if (!out) { err = "write"; return false; }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        err = "rename:" + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }
    return true;
}


bool save_settings(const fs::path& path, const Settings& s, std::string& err) {
    std::string why;
    if (!atomic_write_json(path, settings_to_json(s), why)) {
        err = "config_" + why;
        return false;
    }
    return true;
}

} // namespace dgtlink
