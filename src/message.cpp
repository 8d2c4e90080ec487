// ============================================================================
// message.cpp : implementation for dgtlink/message.hpp
// Per-type schema checks and payload decoding. No exceptions, no asserts:
// every path returns either a Response or a filled ParseError.
// ============================================================================

#include "dgtlink/message.hpp"

#include <sstream>

namespace dgtlink {

// ---------------------------------------------------------------------------
// Fixed payload sizes from the device protocol.
// ---------------------------------------------------------------------------
static constexpr std::size_t BOARD_DUMP_LEN   = 64;
static constexpr std::size_t CLOCK_LEN        = 7;
static constexpr std::size_t FIELD_UPDATE_LEN = 2;
static constexpr std::size_t VERSION_LEN      = 2;


std::optional<MessageType> message_type_from_code(uint8_t code) {
    switch (code) {
        case 0x06: return MessageType::BoardDump;
        case 0x0D: return MessageType::ClockReading;
        case 0x0E: return MessageType::FieldUpdate;
        case 0x0F: return MessageType::EEMoves;
        case 0x10: return MessageType::BusAddress;
        case 0x11: return MessageType::SerialNumber;
        case 0x12: return MessageType::Trademark;
        case 0x13: return MessageType::Version;
        default:   return std::nullopt;
    }
}


const char* message_type_name(MessageType t) {
    switch (t) {
        case MessageType::BoardDump:    return "board_dump";
        case MessageType::ClockReading: return "clock";
        case MessageType::FieldUpdate:  return "field_update";
        case MessageType::EEMoves:      return "ee_moves";
        case MessageType::BusAddress:   return "bus_address";
        case MessageType::SerialNumber: return "serial_number";
        case MessageType::Trademark:    return "trademark";
        case MessageType::Version:      return "version";
    }
    return "unknown";
}


const char* parse_error_kind_name(ParseErrorKind k) {
    switch (k) {
        case ParseErrorKind::UnknownMessageType: return "unknown_message_type";
        case ParseErrorKind::InvalidLength:      return "invalid_length";
        case ParseErrorKind::InvalidPiece:       return "invalid_piece";
        case ParseErrorKind::InvalidMove:        return "invalid_move";
        case ParseErrorKind::Unsupported:        return "unsupported";
    }
    return "unknown";
}


std::string describe(const ParseError& err) {
    std::ostringstream os;
    os << "reason=" << parse_error_kind_name(err.kind);
    if (err.message_type) os << " type=" << message_type_name(*err.message_type);
    else                  os << " code=" << unsigned(err.code);

    switch (err.kind) {
        case ParseErrorKind::InvalidLength:
            os << " expected=" << err.expected << " actual=" << err.actual;
            break;
        case ParseErrorKind::InvalidPiece:
            os << " byte=" << unsigned(err.offending);
            break;
        case ParseErrorKind::InvalidMove:
            os << " square=" << unsigned(err.offending);
            break;
        case ParseErrorKind::UnknownMessageType:
        case ParseErrorKind::Unsupported:
            break;
    }
    return os.str();
}


uint8_t bcd_to_int(uint8_t b) {
    return static_cast<uint8_t>(10 * (b >> 4) + (b & 0x0F));
}


ClockTime clock_time_from_bcd(const uint8_t* bcd3) {
    ClockTime t;
    t.hours   = bcd_to_int(bcd3[0]);
    t.minutes = bcd_to_int(bcd3[1]);
    t.seconds = bcd_to_int(bcd3[2]);
    return t;
}


TurnStatus turn_status_from_byte(uint8_t b) {
    if (b & 0x01) return TurnStatus::NoClock;      // bit 0 wins over bit 3
    if (b & 0x08) return TurnStatus::BlackToMove;
    return TurnStatus::WhiteToMove;
}


const char* turn_status_name(TurnStatus s) {
    switch (s) {
        case TurnStatus::NoClock:     return "no_clock";
        case TurnStatus::WhiteToMove: return "white";
        case TurnStatus::BlackToMove: return "black";
    }
    return "unknown";
}


// ---------------------------------------------------------------------------
// UTF-8 lossy decode.
// Accepts well-formed sequences (no overlongs, no surrogates, <= U+10FFFF).
// A lead byte that cannot start a sequence, or a sequence cut short, emits
// one U+FFFD and decoding resumes at the first byte that broke it.
// ---------------------------------------------------------------------------
std::string text_from_bytes_lossy(const std::vector<uint8_t>& bytes) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());
    const std::size_t n = bytes.size();
    std::size_t i = 0;

    while (i < n) {
        const uint8_t c = bytes[i];

        if (c < 0x80) {                     // ASCII fast path
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        std::size_t need = 0;
        uint8_t lo = 0x80, hi = 0xBF;       // allowed range for the 2nd byte
        if      (c >= 0xC2 && c <= 0xDF) { need = 1; }
        else if (c == 0xE0)              { need = 2; lo = 0xA0; }
        else if (c >= 0xE1 && c <= 0xEC) { need = 2; }
        else if (c == 0xED)              { need = 2; hi = 0x9F; }
        else if (c >= 0xEE && c <= 0xEF) { need = 2; }
        else if (c == 0xF0)              { need = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { need = 3; }
        else if (c == 0xF4)              { need = 3; hi = 0x8F; }
        else {
            out += REPLACEMENT;             // stray continuation or invalid lead
            ++i;
            continue;
        }

        std::size_t j = 1;
        for (; j <= need; ++j) {
            if (i + j >= n) break;
            const uint8_t cc = bytes[i + j];
            const uint8_t min = (j == 1) ? lo : 0x80;
            const uint8_t max = (j == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
        }

        if (j == need + 1) {
            out.append(reinterpret_cast<const char*>(&bytes[i]), need + 1);
            i += need + 1;
        } else {
            out += REPLACEMENT;             // one replacement per broken prefix
            i += j;
        }
    }
    return out;
}


// ---------------------------------------------------------------------------
// Per-type decoders. Each assumes the type is already resolved and fills
// err itself on failure.
// ---------------------------------------------------------------------------

static ParseError length_error(uint8_t code, MessageType t,
                               std::size_t expected, std::size_t actual) {
    ParseError e;
    e.kind = ParseErrorKind::InvalidLength;
    e.code = code;
    e.message_type = t;
    e.expected = expected;
    e.actual = actual;
    return e;
}


static ParseError value_error(ParseErrorKind kind, uint8_t code, MessageType t,
                              uint8_t offending) {
    ParseError e;
    e.kind = kind;
    e.code = code;
    e.message_type = t;
    e.offending = offending;
    return e;
}


static std::optional<Response> decode_board_dump(uint8_t code,
                                                 const std::vector<uint8_t>& p,
                                                 ParseError& err) {
    if (p.size() != BOARD_DUMP_LEN) {
        err = length_error(code, MessageType::BoardDump, BOARD_DUMP_LEN, p.size());
        return std::nullopt;
    }
    BoardDump dump;
    for (std::size_t i = 0; i < BOARD_DUMP_LEN; ++i) {
        auto piece = piece_from_byte(p[i]);
        if (!piece) {
            // One bad square rejects the whole dump.
            err = value_error(ParseErrorKind::InvalidPiece, code, MessageType::BoardDump, p[i]);
            return std::nullopt;
        }
        dump.board[i] = *piece;
    }
    return Response{dump};
}


static std::optional<Response> decode_clock(uint8_t code,
                                            const std::vector<uint8_t>& p,
                                            ParseError& err) {
    if (p.size() != CLOCK_LEN) {
        err = length_error(code, MessageType::ClockReading, CLOCK_LEN, p.size());
        return std::nullopt;
    }
    ClockReading r;
    r.white  = clock_time_from_bcd(&p[0]);
    r.black  = clock_time_from_bcd(&p[3]);
    r.status = turn_status_from_byte(p[6]);
    return Response{r};
}


static std::optional<Response> decode_field_update(uint8_t code,
                                                   const std::vector<uint8_t>& p,
                                                   ParseError& err) {
    if (p.size() != FIELD_UPDATE_LEN) {
        err = length_error(code, MessageType::FieldUpdate, FIELD_UPDATE_LEN, p.size());
        return std::nullopt;
    }
    if (p[0] >= BOARD_SQUARES) {
        err = value_error(ParseErrorKind::InvalidMove, code, MessageType::FieldUpdate, p[0]);
        return std::nullopt;
    }
    auto piece = piece_from_byte(p[1]);
    if (!piece) {
        err = value_error(ParseErrorKind::InvalidPiece, code, MessageType::FieldUpdate, p[1]);
        return std::nullopt;
    }
    FieldUpdate f;
    f.update.square = p[0];
    f.update.piece  = *piece;
    return Response{f};
}


static std::optional<Response> decode_version(uint8_t code,
                                              const std::vector<uint8_t>& p,
                                              ParseError& err) {
    if (p.size() != VERSION_LEN) {
        err = length_error(code, MessageType::Version, VERSION_LEN, p.size());
        return std::nullopt;
    }
    VersionInfo v;
    v.major = p[0];
    v.minor = p[1];
    v.text  = std::to_string(unsigned(p[0])) + "." + std::to_string(unsigned(p[1]));
    return Response{v};
}


std::optional<Response> decode_response(uint8_t code,
                                        const std::vector<uint8_t>& payload,
                                        ParseError& err) {
    auto type = message_type_from_code(code);
    if (!type) {
        err = ParseError{};
        err.kind = ParseErrorKind::UnknownMessageType;
        err.code = code;
        return std::nullopt;
    }

    switch (*type) {
        case MessageType::BoardDump:    return decode_board_dump(code, payload, err);
        case MessageType::ClockReading: return decode_clock(code, payload, err);
        case MessageType::FieldUpdate:  return decode_field_update(code, payload, err);
        case MessageType::Version:      return decode_version(code, payload, err);

        case MessageType::SerialNumber:
            return Response{SerialNumber{text_from_bytes_lossy(payload)}};
        case MessageType::BusAddress:
            return Response{BusAddress{text_from_bytes_lossy(payload)}};
        case MessageType::Trademark:
            return Response{Trademark{text_from_bytes_lossy(payload)}};

        case MessageType::EEMoves:
            // Stored-move layout is not decoded; refuse rather than guess.
            err = ParseError{};
            err.kind = ParseErrorKind::Unsupported;
            err.code = code;
            err.message_type = *type;
            err.actual = payload.size();
            return std::nullopt;
    }

    err = ParseError{};
    err.code = code;
    return std::nullopt;
}


MessageType response_type(const Response& r) {
    switch (r.index()) {
        case 0: return MessageType::BoardDump;
        case 1: return MessageType::ClockReading;
        case 2: return MessageType::FieldUpdate;
        case 3: return MessageType::SerialNumber;
        case 4: return MessageType::BusAddress;
        case 5: return MessageType::Trademark;
        default: return MessageType::Version;
    }
}

} // namespace dgtlink
