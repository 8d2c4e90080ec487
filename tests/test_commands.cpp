#include <doctest/doctest.h>
#include "commands.hpp"
#include "dgtlink/board.hpp"
#include "dgtlink/command.hpp"

#include <string>

using namespace dgtlink;

TEST_CASE("Command bytes match the wire table") {
    CHECK(command_to_byte(Command::Reset) == 0x40);
    CHECK(command_to_byte(Command::RequestClock) == 0x41);
    CHECK(command_to_byte(Command::RequestBoard) == 0x42);
    CHECK(command_to_byte(Command::EnableUpdate) == 0x43);
    CHECK(command_to_byte(Command::RequestUpdate) == 0x44);
    CHECK(command_to_byte(Command::RequestSerialNumber) == 0x45);
    CHECK(command_to_byte(Command::RequestBusAddress) == 0x46);
    CHECK(command_to_byte(Command::RequestTrademark) == 0x47);
    CHECK(command_to_byte(Command::RequestEEMoves) == 0x49);
    CHECK(command_to_byte(Command::RequestNiceUpdate) == 0x4B);
    CHECK(command_to_byte(Command::RequestVersion) == 0x4D);
}

TEST_CASE("Every command decodes back from its byte; other bytes do not") {
    int hits = 0;
    for (int b = 0; b <= 0xFF; ++b) {
        auto c = command_from_byte(static_cast<uint8_t>(b));
        if (c) {
            CHECK(command_to_byte(*c) == b);
            ++hits;
        }
    }
    CHECK(hits == COMMAND_COUNT);
    CHECK_FALSE(command_from_byte(0x48).has_value());
    CHECK_FALSE(command_from_byte(0x4C).has_value());
}

TEST_CASE("Only requests expect a reply") {
    CHECK(expected_reply(Command::RequestVersion) == MessageType::Version);
    CHECK(expected_reply(Command::RequestBoard) == MessageType::BoardDump);
    CHECK(expected_reply(Command::RequestEEMoves) == MessageType::EEMoves);
    CHECK_FALSE(expected_reply(Command::Reset).has_value());
    CHECK_FALSE(expected_reply(Command::RequestUpdate).has_value());
}

TEST_CASE("decode_pretty renders one key=value line per response") {
    VersionInfo v;
    v.major = 1;
    v.minor = 2;
    v.text = "1.2";
    CHECK(decode_pretty(Response{v}) == "status=ok type=version version=1.2");

    ClockReading c;
    c.white = ClockTime{1, 30, 0};
    c.black = ClockTime{1, 29, 59};
    c.status = TurnStatus::BlackToMove;
    CHECK(decode_pretty(Response{c}) ==
          "status=ok type=clock white=01:30:00 black=01:29:59 turn=black");

    FieldUpdate u;
    u.update = SquareUpdate{12, Piece::WhitePawn};
    CHECK(decode_pretty(Response{u}) == "status=ok type=field_update square=12 piece=white_pawn");

    CHECK(decode_pretty(Response{SerialNumber{"12345"}}) == "status=ok type=serial_number serial=12345");
}

TEST_CASE("A start-position dump pretty-prints with its classification and rows") {
    BoardDump d;
    d.board = standard_start();
    CHECK(decode_pretty(Response{d}) == "status=ok type=board_dump start=normal pieces=32");

    auto rows = board_rows_pretty(d.board);
    REQUIRE(rows.size() == 8);
    CHECK(rows[0] == "row=0 squares=RNBKQBNR");
    CHECK(rows[1] == "row=1 squares=PPPPPPPP");
    CHECK(rows[4] == "row=4 squares=........");
    CHECK(rows[7] == "row=7 squares=rnbkqbnr");
}

TEST_CASE("response_to_json carries the same fields") {
    VersionInfo v;
    v.major = 3;
    v.minor = 14;
    v.text = "3.14";
    auto j = response_to_json(Response{v});
    CHECK(j["status"] == "ok");
    CHECK(j["type"] == "version");
    CHECK(j["major"] == 3);
    CHECK(j["minor"] == 14);
    CHECK(j["version"] == "3.14");

    BoardDump d;
    d.board = mirror_start();
    auto jd = response_to_json(Response{d});
    CHECK(jd["start"] == "mirror");
    REQUIRE(jd["rows"].size() == 8);
    CHECK(jd["rows"][0] == "rnbqkbnr");
}

TEST_CASE("Parse errors and moves render for logs and JSON") {
    ParseError e;
    e.kind = ParseErrorKind::InvalidLength;
    e.code = 0x13;
    e.message_type = MessageType::Version;
    e.expected = 2;
    e.actual = 1;
    auto j = parse_error_to_json(e);
    CHECK(j["status"] == "error");
    CHECK(j["reason"] == "invalid_length");
    CHECK(j["type"] == "version");
    CHECK(j["expected"] == 2);
    CHECK(j["actual"] == 1);

    MoveResult m;
    m.kind = MoveKind::SimpleCapture;
    m.from = 12;
    m.to = 21;
    m.piece = Piece::WhiteKnight;
    m.captured = Piece::BlackPawn;
    CHECK(move_pretty(m) ==
          "event=move kind=capture from=12 to=21 piece=white_knight captured=black_pawn");
    CHECK(move_to_json(m)["captured"] == "black_pawn");

    m.captured = Piece::Empty;
    CHECK(move_to_json(m).count("captured") == 0);
}

TEST_CASE("hex_bytes is lowercase and space separated") {
    CHECK(hex_bytes({0x86, 0x00, 0x05, 0xAB}) == "86 00 05 ab");
    CHECK(hex_bytes({}).empty());
}
