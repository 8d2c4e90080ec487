/**
 * @file test-decode/main.cpp
 * @brief Manual tool: feed raw board bytes through the dgtlink decoder.
 *
 * Runs a hex byte string through the same Session the CLI uses, without a
 * serial port, and prints one line per frame. Handy when a capture from a
 * real board looks wrong and you want to see where decoding stops.
 *
 * @section usage Usage
 * @code
 *   # version reply 1.2
 *   ./dgtlink-decode stream 93 00 05 01 02
 *   status=ok type=version version=1.2
 *   event=summary frames_ok=1 parse_errors=0 resync_bytes=0
 *
 *   # noise, then a field update on square 12
 *   ./dgtlink-decode stream 00 7f 8e 00 05 0c 01
 *   status=ok type=field_update square=12 piece=white_pawn
 *   event=summary frames_ok=1 parse_errors=0 resync_bytes=2
 *
 *   # piece byte lookup
 *   ./dgtlink-decode piece 0x0b
 *   byte=11 piece=black_king char=k
 * @endcode
 *
 * Bytes are hex with or without a 0x prefix. Use --json for JSON lines.
 */

#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"

#include "commands.hpp"
#include "dgtlink/session.hpp"
#include "scripted_link.hpp"

using namespace dgtlink;

static bool parse_hex_byte(const std::string& tok, uint8_t& out) {
    std::string s = tok;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s = s.substr(2);
    if (s.empty() || s.size() > 2) return false;
    unsigned v = 0;
    for (char c : s) {
        v <<= 4;
        if (c >= '0' && c <= '9')      v |= unsigned(c - '0');
        else if (c >= 'a' && c <= 'f') v |= unsigned(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= unsigned(c - 'A' + 10);
        else return false;
    }
    out = static_cast<uint8_t>(v);
    return true;
}


static bool parse_hex_bytes(const std::vector<std::string>& toks, std::vector<uint8_t>& out) {
    for (const auto& t : toks) {
        uint8_t b = 0;
        if (!parse_hex_byte(t, b)) {
            std::cerr << "status=error reason=bad_hex token=" << t << "\n";
            return false;
        }
        out.push_back(b);
    }
    return true;
}


static int run_stream(const std::vector<std::string>& toks, bool json) {
    std::vector<uint8_t> bytes;
    if (!parse_hex_bytes(toks, bytes)) return 2;

    dgtlink_test::ScriptedLink link(bytes);
    Session session(link);
    Response r;
    std::string err;

    while (true) {
        const PollStatus st = session.poll(r, err);
        if (st == PollStatus::IoFailure) break;

        if (st == PollStatus::Ok) {
            if (json) std::cout << response_to_json(r).dump() << "\n";
            else      std::cout << decode_pretty(r) << "\n";
            if (session.last_move()) {
                if (json) std::cout << move_to_json(*session.last_move()).dump() << "\n";
                else      std::cout << move_pretty(*session.last_move()) << "\n";
            }
        } else if (st == PollStatus::ParseFailure) {
            if (json) std::cout << parse_error_to_json(session.last_parse_error()).dump() << "\n";
            else      std::cout << "status=error " << err << "\n";
        } else {
            std::cout << "status=error " << err << "\n";
        }
    }

    std::cout << "event=summary frames_ok=" << session.frames_ok()
              << " parse_errors=" << session.parse_errors()
              << " resync_bytes=" << session.resync_bytes() << "\n";
    if (!session.pending_updates().empty())
        std::cout << "event=pending updates=" << session.pending_updates().size() << "\n";
    return session.parse_errors() ? 4 : 0;
}


static int run_piece(const std::string& tok) {
    uint8_t b = 0;
    if (!parse_hex_byte(tok, b)) {
        std::cerr << "status=error reason=bad_hex token=" << tok << "\n";
        return 2;
    }
    auto p = piece_from_byte(b);
    if (!p) {
        std::cout << "byte=" << unsigned(b) << " piece=invalid\n";
        return 4;
    }
    std::cout << "byte=" << unsigned(b) << " piece=" << piece_name(*p)
              << " char=" << (*p == Piece::Empty ? '.' : piece_to_char(*p)) << "\n";
    return 0;
}


int main(int argc, char** argv) {
    CLI::App app{"dgtlink decoder test tool"};
    app.require_subcommand(1);

    bool json = false;
    app.add_flag("--json", json, "Print JSON lines instead of key=value");

    std::vector<std::string> stream_bytes;
    auto* stream = app.add_subcommand("stream", "Decode a byte stream into frames and responses");
    stream->add_option("bytes", stream_bytes, "Hex bytes, e.g. 93 00 05 01 02")->required();

    std::string piece_byte;
    auto* piece = app.add_subcommand("piece", "Look up one piece byte");
    piece->add_option("byte", piece_byte, "Hex byte, e.g. 0x0b")->required();

    CLI11_PARSE(app, argc, argv);

    if (*stream) return run_stream(stream_bytes, json);
    if (*piece)  return run_piece(piece_byte);
    return 2;
}
