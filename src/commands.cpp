#include "commands.hpp"       // request sequences, pretty and JSON renderers

#include <cstdio>             // std::snprintf for fixed-width clock fields
#include <sstream>            // std::ostringstream: assemble key=value lines

#include "dgtlink/board_tracker.hpp"   // classify_board() for start=...


namespace dgtlink {
// ============================================================================
// Request sequences
// ============================================================================

std::vector<Command> info_commands() {
    return { Command::RequestSerialNumber,
             Command::RequestBusAddress,
             Command::RequestTrademark,
             Command::RequestVersion };
}


std::optional<MessageType> expected_reply(Command c) {
    switch (c) {
        case Command::RequestClock:        return MessageType::ClockReading;
        case Command::RequestBoard:        return MessageType::BoardDump;
        case Command::RequestSerialNumber: return MessageType::SerialNumber;
        case Command::RequestBusAddress:   return MessageType::BusAddress;
        case Command::RequestTrademark:    return MessageType::Trademark;
        case Command::RequestEEMoves:      return MessageType::EEMoves;
        case Command::RequestVersion:      return MessageType::Version;
        case Command::Reset:
        case Command::EnableUpdate:
        case Command::RequestUpdate:
        case Command::RequestNiceUpdate:
            return std::nullopt;
    }
    return std::nullopt;
}


// ============================================================================
// Small formatting helpers
// ============================================================================

std::string format_clock_time(const ClockTime& t) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u",
                  unsigned(t.hours), unsigned(t.minutes), unsigned(t.seconds));
    return buf;
}


std::string hex_bytes(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i) out.push_back(' ');
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0F]);
    }
    return out;
}


static int piece_count(const BoardState& b) {
    int n = 0;
    for (Piece p : b) if (p != Piece::Empty) ++n;
    return n;
}


static char square_char(Piece p) {
    return p == Piece::Empty ? '.' : piece_to_char(p);
}


std::vector<std::string> board_rows_pretty(const BoardState& board) {
    std::vector<std::string> rows;
    rows.reserve(8);
    for (int r = 0; r < 8; ++r) {
        std::string line = "row=" + std::to_string(r) + " squares=";
        for (int f = 0; f < 8; ++f) line.push_back(square_char(board[r * 8 + f]));
        rows.push_back(line);
    }
    return rows;
}


// ============================================================================
// decode_pretty
// ----------------------------------------------------------------------------
// One line per response, always starting with status=ok type=<name>.
// The type name comes from message_type_name() so logs and JSON agree.
// ============================================================================

std::string decode_pretty(const Response& r) {
    std::ostringstream os;
    os << "status=ok type=" << message_type_name(response_type(r));

    if (const auto* d = std::get_if<BoardDump>(&r)) {
        os << " start=" << start_position_name(classify_board(d->board))
           << " pieces=" << piece_count(d->board);
    } else if (const auto* c = std::get_if<ClockReading>(&r)) {
        os << " white=" << format_clock_time(c->white)
           << " black=" << format_clock_time(c->black)
           << " turn="  << turn_status_name(c->status);
    } else if (const auto* u = std::get_if<FieldUpdate>(&r)) {
        os << " square=" << unsigned(u->update.square)
           << " piece="  << piece_name(u->update.piece);
    } else if (const auto* s = std::get_if<SerialNumber>(&r)) {
        os << " serial=" << s->text;
    } else if (const auto* a = std::get_if<BusAddress>(&r)) {
        os << " bus_address=" << a->text;
    } else if (const auto* t = std::get_if<Trademark>(&r)) {
        os << " trademark=" << t->text;
    } else if (const auto* v = std::get_if<VersionInfo>(&r)) {
        os << " version=" << v->text;
    }
    return os.str();
}


// ============================================================================
// JSON rendering (nlohmann::json)
// ============================================================================

static nlohmann::json clock_time_json(const ClockTime& t) {
    nlohmann::json j;
    j["hours"]   = t.hours;
    j["minutes"] = t.minutes;
    j["seconds"] = t.seconds;
    j["text"]    = format_clock_time(t);
    return j;
}


nlohmann::json response_to_json(const Response& r) {
    nlohmann::json j;
    j["status"] = "ok";
    j["type"]   = message_type_name(response_type(r));

    if (const auto* d = std::get_if<BoardDump>(&r)) {
        nlohmann::json rows = nlohmann::json::array();
        for (int rank = 0; rank < 8; ++rank) {
            std::string row;
            for (int f = 0; f < 8; ++f) row.push_back(square_char(d->board[rank * 8 + f]));
            rows.push_back(row);
        }
        j["rows"]   = rows;
        j["start"]  = start_position_name(classify_board(d->board));
        j["pieces"] = piece_count(d->board);
    } else if (const auto* c = std::get_if<ClockReading>(&r)) {
        j["white"] = clock_time_json(c->white);
        j["black"] = clock_time_json(c->black);
        j["turn"]  = turn_status_name(c->status);
    } else if (const auto* u = std::get_if<FieldUpdate>(&r)) {
        j["square"] = u->update.square;
        j["piece"]  = piece_name(u->update.piece);
    } else if (const auto* s = std::get_if<SerialNumber>(&r)) {
        j["serial"] = s->text;
    } else if (const auto* a = std::get_if<BusAddress>(&r)) {
        j["bus_address"] = a->text;
    } else if (const auto* t = std::get_if<Trademark>(&r)) {
        j["trademark"] = t->text;
    } else if (const auto* v = std::get_if<VersionInfo>(&r)) {
        j["major"]   = v->major;
        j["minor"]   = v->minor;
        j["version"] = v->text;
    }
    return j;
}


// ============================================================================
// Moves
// ============================================================================

std::string move_pretty(const MoveResult& m) {
    std::ostringstream os;
    os << "event=move kind=" << move_kind_name(m.kind)
       << " from=" << unsigned(m.from)
       << " to="   << unsigned(m.to)
       << " piece=" << piece_name(m.piece);
    if (m.captured != Piece::Empty) os << " captured=" << piece_name(m.captured);
    return os.str();
}


nlohmann::json move_to_json(const MoveResult& m) {
    nlohmann::json j;
    j["event"] = "move";
    j["kind"]  = move_kind_name(m.kind);
    j["from"]  = m.from;
    j["to"]    = m.to;
    j["piece"] = piece_name(m.piece);
    if (m.captured != Piece::Empty) j["captured"] = piece_name(m.captured);
    return j;
}


nlohmann::json parse_error_to_json(const ParseError& err) {
    nlohmann::json j;
    j["status"] = "error";
    j["reason"] = parse_error_kind_name(err.kind);
    j["code"]   = err.code;
    if (err.message_type) j["type"] = message_type_name(*err.message_type);

    switch (err.kind) {
        case ParseErrorKind::InvalidLength:
            j["expected"] = err.expected;
            j["actual"]   = err.actual;
            break;
        case ParseErrorKind::InvalidPiece:
            j["byte"] = err.offending;
            break;
        case ParseErrorKind::InvalidMove:
            j["square"] = err.offending;
            break;
        case ParseErrorKind::UnknownMessageType:
        case ParseErrorKind::Unsupported:
            break;
    }
    return j;
}

} // namespace dgtlink
