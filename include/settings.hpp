/**
 * @page dgt-settings dgtlink Settings
 * @file settings.hpp
 * @brief Persisted CLI defaults in `$XDG_CONFIG_HOME/dgtlink/config.json`.
 *
 * @details
 * PURPOSE
 * -------
 * Remember the port and link settings so that `dgtlink-cli --board` works
 * without repeating `--dev /dev/serial/by-id/...` every time.
 *
 * FILE FORMAT
 * -----------
 * @code
 *   {
 *     "dev": "/dev/serial/by-id/usb-DGT_...",
 *     "baud": 9600,
 *     "timeout_ms": 1000,
 *     "flow_control": true,
 *     "format": "pretty"
 *   }
 * @endcode
 * - Every key is optional. Unknown keys are ignored.
 * - A key with the wrong type or an out-of-range value keeps its default and
 *   adds a warning such as `bad_value:baud`.
 * - The file is written atomically (temp file + rename).
 *
 * PRECEDENCE
 * ----------
 * built-in defaults < config file < explicit CLI flags.
 * The merge with CLI flags happens in main.cpp.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "serial_io.hpp"

namespace dgtlink {

enum class OutputFormat : uint8_t { Pretty, Json, Raw };

const char* output_format_name(OutputFormat f);
std::optional<OutputFormat> output_format_from_name(const std::string& name);

static constexpr int DEFAULT_TIMEOUT_MS = 1000;
static constexpr int MAX_TIMEOUT_MS     = 60000;

struct Settings {
    std::string  dev;
    int          baud{SERIAL_DEFAULT_BAUD};
    int          timeout_ms{DEFAULT_TIMEOUT_MS};
    bool         flow_control{true};
    OutputFormat format{OutputFormat::Pretty};
};

/// `$XDG_CONFIG_HOME/dgtlink`, falling back to `$HOME/.config/dgtlink`.
std::filesystem::path default_config_dir();

/// default_config_dir() / "config.json".
std::filesystem::path default_config_path();

/**
 * @brief Overlay the keys present in @p j onto @p s.
 *
 * @param warnings  receives one `bad_value:<key>` entry per rejected key
 * @return false only when @p j is not a JSON object (s untouched)
 */
bool settings_from_json(const nlohmann::json& j, Settings& s,
                        std::vector<std::string>& warnings);

nlohmann::json settings_to_json(const Settings& s);

/**
 * @brief Read a config file into @p s.
 *
 * A missing file is not an error: @p s keeps its values and true is returned.
 * Unreadable or malformed JSON returns false with @p err set
 * (`config_unreadable`, `config_parse:<what>`, `config_not_object`).
 */
bool load_settings(const std::filesystem::path& path, Settings& s,
                   std::vector<std::string>& warnings, std::string& err);

/**
 * @brief Write @p j to @p path via a temp file and rename.
 *
 * Parent directories are created. On failure @p err is one of
 * `mkdir:<msg>`, `write_open`, `write`, `rename:<msg>`.
 */
bool atomic_write_json(const std::filesystem::path& path, const nlohmann::json& j,
                       std::string& err);

/// atomic_write_json() of settings_to_json(); errors are prefixed `config_`.
bool save_settings(const std::filesystem::path& path, const Settings& s,
                   std::string& err);

} // namespace dgtlink
