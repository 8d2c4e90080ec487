#include <doctest/doctest.h>
#include "dgtlink/board_tracker.hpp"
#include "scripted_link.hpp"

#include <string>

using namespace dgtlink;

TEST_CASE("Standard start classifies as Normal") {
    BoardTracker t(standard_start());
    CHECK(t.classify() == StartingClassification::Normal);
    CHECK(std::string(start_position_name(t.classify())) == "normal");
}

TEST_CASE("Both mirrored layouts classify as Mirror") {
    CHECK(classify_board(mirror_start()) == StartingClassification::Mirror);

    // Colors swapped, King before Queen on both back ranks.
    const char* const swapped[8] = {
        "rnbkqbnr",
        "pppppppp",
        "........",
        "........",
        "........",
        "........",
        "PPPPPPPP",
        "RNBKQBNR",
    };
    CHECK(classify_board(dgtlink_test::board_from_rows(swapped)) == StartingClassification::Mirror);
}

TEST_CASE("Near misses classify as None") {
    CHECK(classify_board(empty_board()) == StartingClassification::None);

    BoardState b = standard_start();
    b[3] = Piece::WhiteQueen;
    b[4] = Piece::WhiteKing;
    CHECK(classify_board(b) == StartingClassification::None);

    b = standard_start();
    b[15] = Piece::Empty;
    CHECK(classify_board(b) == StartingClassification::None);

    b = standard_start();
    b[63] = Piece::WhiteRook;
    CHECK(classify_board(b) == StartingClassification::None);
}

TEST_CASE("A pawn pushed into the centre ends the start position") {
    BoardTracker t(standard_start());
    REQUIRE(t.apply({8, Piece::Empty}));
    REQUIRE(t.apply({16, Piece::WhitePawn}));
    CHECK(t.classify() == StartingClassification::None);
    CHECK(t.at(8) == Piece::Empty);
    CHECK(t.at(16) == Piece::WhitePawn);
    CHECK(t.updates_applied() == 2);
}

TEST_CASE("Any occupied centre square gives None even on a start layout") {
    BoardState b = standard_start();
    b[32] = Piece::BlackKnight;
    CHECK(classify_board(b) == StartingClassification::None);
}

TEST_CASE("apply replaces exactly one square") {
    BoardTracker t(standard_start());
    const BoardState before = t.board();
    REQUIRE(t.apply({20, Piece::BlackBishop}));
    for (int sq = 0; sq < BOARD_SQUARES; ++sq) {
        const Piece expected = sq == 20 ? Piece::BlackBishop : before[sq];
        CHECK(t.board()[sq] == expected);
    }
}

TEST_CASE("Applying the same update twice changes nothing the second time") {
    BoardTracker t(standard_start());
    t.apply({9, Piece::Empty});
    const BoardState once = t.board();
    t.apply({9, Piece::Empty});
    CHECK(t.board() == once);
}

TEST_CASE("Out-of-range squares are refused") {
    BoardTracker t(standard_start());
    CHECK_FALSE(t.apply({64, Piece::WhiteQueen}));
    CHECK_FALSE(t.apply({255, Piece::Empty}));
    CHECK(t.board() == standard_start());
    CHECK(t.updates_applied() == 0);
    CHECK(t.at(64) == Piece::Empty);
}

TEST_CASE("reset replaces the board and the counter") {
    BoardTracker t;
    CHECK(t.board() == empty_board());
    t.apply({0, Piece::WhiteRook});
    t.reset(standard_start());
    CHECK(t.updates_applied() == 0);
    CHECK(t.classify() == StartingClassification::Normal);
}

TEST_CASE("render_rows prints square 0 first with dots for empty squares") {
    BoardTracker t(standard_start());
    auto rows = t.render_rows();
    REQUIRE(rows.size() == 8);
    CHECK(rows[0] == "RNBKQBNR");
    CHECK(rows[3] == "........");
    CHECK(rows[6] == "pppppppp");
}
