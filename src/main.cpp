#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include "CLI/CLI.hpp"

#include "board_registry.hpp"     // discover_boards(), save_registry()
#include "command_dispatch.hpp"   // names_to_commands()
#include "commands.hpp"           // decode_pretty(), response_to_json(), expected_reply()
#include "settings.hpp"           // Settings, load_settings(), save_settings()
#include "serial_io.hpp"          // is_supported_baud()

#include "dgtlink/session.hpp"
#include "dgtlink/transport/transport_linux_serial.hpp"


// Exit codes, stable for scripts.
enum : int {
  EXIT_OK      = 0,
  EXIT_IO      = 1,   // open/read/write failure
  EXIT_USAGE   = 2,   // bad flags or config
  EXIT_TIMEOUT = 3,   // board did not answer
  EXIT_DECODE  = 4    // board answered with something undecodable
};

// Frames looked at while waiting for one reply; the board may interleave
// field updates and clock frames when update mode is on.
static constexpr int REPLY_MAX_FRAMES = 8;

static bool g_verbose = false;

// ---- logging: key=value lines, diagnostics on stderr ----
static void log_error(const std::string& reason_kv) {
  std::cerr << "status=error " << reason_kv << "\n";
}

static void log_warn(const std::string& reason) {
  std::cerr << "status=warn reason=" << reason << "\n";
}

static void log_event(const std::string& name, const std::string& kv = "") {
  if (!g_verbose) return;
  std::cerr << "event=" << name;
  if (!kv.empty()) std::cerr << " " << kv;
  std::cerr << "\n";
}

// ---- output: one response in the chosen format ----
static void print_response(const dgtlink::Response& r, const dgtlink::Frame& raw,
                           dgtlink::OutputFormat fmt) {
  switch (fmt) {
    case dgtlink::OutputFormat::Json:
      std::cout << dgtlink::response_to_json(r).dump() << "\n";
      break;
    case dgtlink::OutputFormat::Raw:
      std::cout << "type=" << unsigned(raw.type)
                << " len=" << raw.payload.size()
                << " payload=" << dgtlink::hex_bytes(raw.payload) << "\n";
      break;
    case dgtlink::OutputFormat::Pretty:
      std::cout << dgtlink::decode_pretty(r) << "\n";
      if (const auto* d = std::get_if<dgtlink::BoardDump>(&r)) {
        for (const auto& row : dgtlink::board_rows_pretty(d->board)) std::cout << row << "\n";
      }
      break;
  }
}

static void print_parse_error(const dgtlink::ParseError& e, dgtlink::OutputFormat fmt) {
  if (fmt == dgtlink::OutputFormat::Json)
    std::cout << dgtlink::parse_error_to_json(e).dump() << "\n";
  else
    std::cout << "status=error " << dgtlink::describe(e) << "\n";
}

static void print_move(const dgtlink::MoveResult& m, dgtlink::OutputFormat fmt) {
  if (fmt == dgtlink::OutputFormat::Json)
    std::cout << dgtlink::move_to_json(m).dump() << "\n";
  else
    std::cout << dgtlink::move_pretty(m) << "\n";
}

static int exit_for_io(const dgtlink::Session& s) {
  return s.last_rx() == dgtlink::transport::RxResult::Timeout ? EXIT_TIMEOUT : EXIT_IO;
}

// ---------------------------------------------------------------------------
// One request/reply exchange. Frames of other types are printed (they are
// real board output) but do not end the wait.
// ---------------------------------------------------------------------------
static int run_command(dgtlink::Session& s, dgtlink::Command c, dgtlink::OutputFormat fmt) {
  std::string err;
  if (!s.send(c, err)) { log_error(err); return EXIT_IO; }
  log_event("sent", std::string("command=") + dgtlink::command_name(c));

  const auto want = dgtlink::expected_reply(c);
  if (!want) return EXIT_OK;

  dgtlink::Response r;
  for (int i = 0; i < REPLY_MAX_FRAMES; ++i) {
    switch (s.poll(r, err)) {
      case dgtlink::PollStatus::Ok:
        log_event("frame", std::string("type=") + dgtlink::message_type_name(dgtlink::response_type(r)) +
                           " resync_bytes=" + std::to_string(s.resync_bytes()));
        print_response(r, s.last_frame(), fmt);
        if (dgtlink::response_type(r) == *want) return EXIT_OK;
        log_event("skipped", std::string("waiting_for=") + dgtlink::message_type_name(*want));
        break;
      case dgtlink::PollStatus::ParseFailure: {
        const dgtlink::ParseError& pe = s.last_parse_error();
        if (pe.message_type && *pe.message_type == *want) {
          print_parse_error(pe, fmt);
          return EXIT_DECODE;
        }
        log_error(err);
        break;
      }
      case dgtlink::PollStatus::FrameError:
        log_error(err);
        break;
      case dgtlink::PollStatus::IoFailure:
        log_error(err + " command=" + dgtlink::command_cli_name(c));
        return exit_for_io(s);
    }
  }
  log_error(std::string("reason=no_reply command=") + dgtlink::command_cli_name(c));
  return EXIT_TIMEOUT;
}

// ---------------------------------------------------------------------------
// --watch: start sequence, update mode, then print until the link fails.
// A quiet board times out per byte; that is not an end condition here.
// ---------------------------------------------------------------------------
static int run_watch(dgtlink::Session& s, dgtlink::OutputFormat fmt, int max_frames) {
  std::string err;
  if (!s.start(err)) {
    log_error(err);
    if (err.rfind("reason=write_failed", 0) == 0) return EXIT_IO;
    return s.last_rx() == dgtlink::transport::RxResult::Error ? EXIT_IO : EXIT_TIMEOUT;
  }
  log_event("started", std::string("start=") +
                       dgtlink::start_position_name(s.tracker()->classify()));
  {
    dgtlink::Response dump = dgtlink::BoardDump{ s.tracker()->board() };
    print_response(dump, s.last_frame(), fmt);
  }

  if (!s.send(dgtlink::Command::RequestUpdate, err)) { log_error(err); return EXIT_IO; }

  dgtlink::Response r;
  int frames = 0;
  while (max_frames <= 0 || frames < max_frames) {
    switch (s.poll(r, err)) {
      case dgtlink::PollStatus::Ok:
        ++frames;
        print_response(r, s.last_frame(), fmt);
        if (s.last_move()) print_move(*s.last_move(), fmt);
        if (std::holds_alternative<dgtlink::FieldUpdate>(r) && s.tracker()) {
          log_event("board", std::string("start=") +
                             dgtlink::start_position_name(s.tracker()->classify()) +
                             " pending=" + std::to_string(s.pending_updates().size()));
        }
        break;
      case dgtlink::PollStatus::ParseFailure:
        ++frames;
        log_error(err);
        break;
      case dgtlink::PollStatus::FrameError:
        log_error(err);
        break;
      case dgtlink::PollStatus::IoFailure:
        if (s.last_rx() == dgtlink::transport::RxResult::Timeout) {
          log_event("idle");
          break;
        }
        log_error(err);
        return EXIT_IO;
    }
  }
  log_event("done", "frames=" + std::to_string(frames) +
                    " parse_errors=" + std::to_string(s.parse_errors()) +
                    " moves=" + std::to_string(s.moves()));
  return EXIT_OK;
}

int main(int argc, char** argv) {
  CLI::App app{"dgtlink: talk to a serial chessboard"};

  // ---- device / io ----
  std::string dev;
  int baud = dgtlink::SERIAL_DEFAULT_BAUD;
  int timeout_ms = dgtlink::DEFAULT_TIMEOUT_MS;
  int boot_delay_ms = 200;
  bool no_flow = false;
  std::string format = "pretty";
  CLI::Option* opt_dev     = app.add_option("--dev", dev, "Serial device (e.g. /dev/serial/by-id/...)");
  CLI::Option* opt_baud    = app.add_option("--baud", baud, "Baud rate (default 9600)");
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout_ms, "Per-byte read timeout (ms)");
  CLI::Option* opt_noflow  = app.add_flag("--no-flow-control", no_flow, "Disable RTS/CTS");
  CLI::Option* opt_format  = app.add_option("--format", format, "Output format: pretty|json|raw")
                                 ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms)");

  // ---- config ----
  std::string config_path;
  bool save_config = false;
  CLI::Option* opt_config = app.add_option("--config", config_path, "Config file (default $XDG_CONFIG_HOME/dgtlink/config.json)");
  app.add_flag("--save-config", save_config, "Write the effective device settings to the config file");
  app.add_flag("--verbose,-v", g_verbose, "Log frame events to stderr");

  // ---- commands ----
  std::vector<std::string> cmd_names;
  bool want_board = false, want_clock = false, want_info = false, watch = false, do_scan = false;
  int max_frames = 0;
  app.add_option("--cmd", cmd_names,
    "Command: reset|clock|board|update|update-board|serial|bus-address|trademark|ee-moves|update-nice|version");
  app.add_flag("--board", want_board, "Request a board dump");
  app.add_flag("--clock", want_clock, "Request the clock");
  app.add_flag("--info", want_info, "Request serial number, bus address, trademark and version");
  app.add_flag("--watch", watch, "Reset, dump the board, then print updates and moves");
  app.add_option("--max-frames", max_frames, "With --watch: stop after N frames (0 = no limit)");
  app.add_flag("--scan", do_scan, "Probe serial ports for boards, print them and save the registry");

  CLI11_PARSE(app, argc, argv);

  // -------- settings: defaults < config file < flags --------
  const bool config_explicit = opt_config->count() > 0;
  const std::filesystem::path cfg_path = config_explicit ? std::filesystem::path(config_path)
                                                         : dgtlink::default_config_path();
  dgtlink::Settings settings;
  {
    std::error_code ec;
    if (config_explicit && !std::filesystem::exists(cfg_path, ec) && !save_config) {
      log_error("reason=config_missing path=" + cfg_path.string());
      return EXIT_USAGE;
    }
    std::vector<std::string> warnings;
    std::string err;
    if (!dgtlink::load_settings(cfg_path, settings, warnings, err))
      log_warn(err + " path=" + cfg_path.string());
    for (const auto& w : warnings) log_warn(w);
  }

  if (opt_dev->count())     settings.dev = dev;
  if (opt_baud->count())    settings.baud = baud;
  if (opt_timeout->count()) settings.timeout_ms = timeout_ms;
  if (opt_noflow->count())  settings.flow_control = !no_flow;
  if (opt_format->count())  settings.format = *dgtlink::output_format_from_name(format);

  if (!dgtlink::is_supported_baud(settings.baud)) {
    log_error("reason=bad_value:baud value=" + std::to_string(settings.baud));
    return EXIT_USAGE;
  }
  if (settings.timeout_ms <= 0 || settings.timeout_ms > dgtlink::MAX_TIMEOUT_MS) {
    log_error("reason=bad_value:timeout value=" + std::to_string(settings.timeout_ms));
    return EXIT_USAGE;
  }

  if (save_config) {
    std::string err;
    if (!dgtlink::save_settings(cfg_path, settings, err)) {
      log_error("reason=" + err + " path=" + cfg_path.string());
      return EXIT_USAGE;
    }
    log_event("config_saved", "path=" + cfg_path.string());
  }

  // -------- scan mode --------
  if (do_scan) {
    auto boards = dgtlink::discover_boards();
    if (settings.format == dgtlink::OutputFormat::Json) {
      std::cout << dgtlink::registry_to_json(boards).dump() << "\n";
    } else {
      for (const auto& b : boards) {
        std::cout << "serial=" << b.serial
                  << " dev=" << b.dev_path
                  << " link=" << b.link
                  << " online=" << (b.online ? 1 : 0) << "\n";
      }
    }
    std::string err;
    if (!dgtlink::save_registry(boards, err)) log_warn("registry_" + err);
    return EXIT_OK;
  }

  // -------- command list: --cmd in order, then shortcuts --------
  std::vector<dgtlink::Command> cmds;
  {
    std::string err;
    if (!dgtlink::names_to_commands(cmd_names, cmds, err)) {
      log_error("reason=" + err);
      return EXIT_USAGE;
    }
  }
  if (want_board) cmds.push_back(dgtlink::Command::RequestBoard);
  if (want_clock) cmds.push_back(dgtlink::Command::RequestClock);
  if (want_info) {
    for (auto c : dgtlink::info_commands()) cmds.push_back(c);
  }

  if (cmds.empty() && !watch) {
    if (save_config) return EXIT_OK;
    log_error("reason=no_command");
    return EXIT_USAGE;
  }

  // -------- target resolution: --dev / config, else a single online board --------
  if (settings.dev.empty()) {
    auto boards = dgtlink::discover_boards();
    int online_count = 0;
    std::string last_dev;
    for (const auto& b : boards) {
      if (b.online) { online_count++; last_dev = b.link.empty() ? b.dev_path : b.link; }
    }
    if (online_count == 1) {
      settings.dev = last_dev;
      log_event("auto_selected", "dev=" + last_dev);
    } else if (online_count > 1) {
      log_error("reason=multiple_boards_connected need_dev");
      for (const auto& b : boards) {
        if (b.online) std::cerr << "candidate serial=" << b.serial << " dev=" << b.dev_path << "\n";
      }
      return EXIT_USAGE;
    } else {
      log_error("reason=no_boards_online");
      return EXIT_IO;
    }
  }

  // -------- open the link --------
  dgtlink::transport::SerialConfig cfg;
  cfg.path            = settings.dev;
  cfg.baud            = settings.baud;
  cfg.hw_flow         = settings.flow_control;
  cfg.read_timeout_ms = settings.timeout_ms;
  cfg.boot_delay_ms   = boot_delay_ms;

  dgtlink::transport::LinuxSerial link;
  if (!link.begin(cfg)) {
    log_error("reason=open_failed dev=" + settings.dev);
    return EXIT_IO;
  }
  log_event("opened", "dev=" + settings.dev + " baud=" + std::to_string(settings.baud) +
                      " flow_control=" + (settings.flow_control ? "1" : "0"));

  dgtlink::Session session(link);

  for (auto c : cmds) {
    const int rc = run_command(session, c, settings.format);
    if (rc != EXIT_OK) return rc;
  }

  if (watch) return run_watch(session, settings.format, max_frames);
  return EXIT_OK;
}
