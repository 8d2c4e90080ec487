#include <doctest/doctest.h>
#include "dgtlink/move_classifier.hpp"

#include <initializer_list>
#include <string>

using namespace dgtlink;

namespace {

UpdateBatch batch_of(std::initializer_list<SquareUpdate> updates) {
    UpdateBatch b;
    for (const auto& u : updates) b.push_back(u);
    return b;
}

// White king on 3 with rooks on 0 and 7, as in the start layout.
BoardState castle_board() {
    BoardState b = empty_board();
    b[0] = Piece::WhiteRook;
    b[3] = Piece::WhiteKing;
    b[7] = Piece::WhiteRook;
    b[59] = Piece::BlackKing;
    return b;
}

} // namespace

TEST_CASE("diff_boards lists net changes in ascending order") {
    BoardState before = standard_start();
    BoardState after = before;
    after[1] = Piece::Empty;
    after[18] = Piece::WhiteKnight;
    after[6] = Piece::Empty;

    SquareSet vacated, occupied;
    diff_boards(before, after, vacated, occupied);
    REQUIRE(vacated.size() == 2);
    CHECK(vacated[0] == 1);
    CHECK(vacated[1] == 6);
    REQUIRE(occupied.size() == 1);
    CHECK(occupied[0] == 18);
}

TEST_CASE("Lift then place on an empty square is a simple move") {
    auto m = classify_move(standard_start(),
                           batch_of({{1, Piece::Empty}, {18, Piece::WhiteKnight}}));
    CHECK(m.kind == MoveKind::SimpleMove);
    CHECK(m.from == 1);
    CHECK(m.to == 18);
    CHECK(m.piece == Piece::WhiteKnight);
    CHECK(m.captured == Piece::Empty);

    auto p = classify_move(standard_start(),
                           batch_of({{12, Piece::Empty}, {28, Piece::WhitePawn}}));
    CHECK(p.kind == MoveKind::SimpleMove);
}

TEST_CASE("A lifted piece put back is not a move") {
    auto m = classify_move(standard_start(),
                           batch_of({{1, Piece::Empty}, {1, Piece::WhiteKnight}}));
    CHECK(m.kind == MoveKind::NotClassified);

    // Only lifted so far.
    m = classify_move(standard_start(), batch_of({{1, Piece::Empty}}));
    CHECK(m.kind == MoveKind::NotClassified);
}

TEST_CASE("Captures by pieces and by pawns") {
    BoardState b = empty_board();
    b[18] = Piece::WhiteKnight;
    b[35] = Piece::BlackPawn;
    b[27] = Piece::WhitePawn;
    b[36] = Piece::BlackBishop;

    auto m = classify_move(b, batch_of({{18, Piece::Empty}, {35, Piece::Empty},
                                        {35, Piece::WhiteKnight}}));
    CHECK(m.kind == MoveKind::SimpleCapture);
    CHECK(m.from == 18);
    CHECK(m.to == 35);
    CHECK(m.captured == Piece::BlackPawn);

    m = classify_move(b, batch_of({{27, Piece::Empty}, {36, Piece::WhitePawn}}));
    CHECK(m.kind == MoveKind::PawnCapture);
    CHECK(m.captured == Piece::BlackBishop);
}

TEST_CASE("Landing on an own piece is not a capture") {
    BoardState b = empty_board();
    b[18] = Piece::WhiteKnight;
    b[35] = Piece::WhitePawn;
    auto m = classify_move(b, batch_of({{18, Piece::Empty}, {35, Piece::WhiteKnight}}));
    CHECK(m.kind == MoveKind::NotClassified);
}

TEST_CASE("Promotion with and without capture") {
    BoardState b = empty_board();
    b[49] = Piece::WhitePawn;
    b[58] = Piece::BlackRook;

    auto m = classify_move(b, batch_of({{49, Piece::Empty}, {57, Piece::WhiteQueen}}));
    CHECK(m.kind == MoveKind::Promotion);
    CHECK(m.from == 49);
    CHECK(m.to == 57);
    CHECK(m.piece == Piece::WhiteQueen);

    m = classify_move(b, batch_of({{49, Piece::Empty}, {58, Piece::Empty},
                                   {58, Piece::WhiteKnight}}));
    CHECK(m.kind == MoveKind::PromotionCapture);
    CHECK(m.captured == Piece::BlackRook);

    // Pawns do not turn into kings, nor into the other side's pieces.
    m = classify_move(b, batch_of({{49, Piece::Empty}, {57, Piece::WhiteKing}}));
    CHECK(m.kind == MoveKind::NotClassified);
    m = classify_move(b, batch_of({{49, Piece::Empty}, {57, Piece::BlackQueen}}));
    CHECK(m.kind == MoveKind::NotClassified);
}

TEST_CASE("En passant is recognized once the victim is lifted") {
    BoardState b = empty_board();
    b[36] = Piece::WhitePawn;
    b[37] = Piece::BlackPawn;

    auto partial = classify_move(b, batch_of({{36, Piece::Empty}, {45, Piece::WhitePawn}}));
    CHECK(partial.kind == MoveKind::NotClassified);

    auto m = classify_move(b, batch_of({{36, Piece::Empty}, {45, Piece::WhitePawn},
                                        {37, Piece::Empty}}));
    CHECK(m.kind == MoveKind::PawnCapture);
    CHECK(m.from == 36);
    CHECK(m.to == 45);
    CHECK(m.piece == Piece::WhitePawn);
    CHECK(m.captured == Piece::BlackPawn);
}

TEST_CASE("Castling towards the near rook is short, towards the far rook long") {
    auto s = classify_move(castle_board(),
                           batch_of({{3, Piece::Empty}, {1, Piece::WhiteKing},
                                     {0, Piece::Empty}, {2, Piece::WhiteRook}}));
    CHECK(s.kind == MoveKind::ShortCastle);
    CHECK(s.from == 3);
    CHECK(s.to == 1);
    CHECK(s.piece == Piece::WhiteKing);

    auto l = classify_move(castle_board(),
                           batch_of({{3, Piece::Empty}, {5, Piece::WhiteKing},
                                     {7, Piece::Empty}, {4, Piece::WhiteRook}}));
    CHECK(l.kind == MoveKind::LongCastle);
    CHECK(l.from == 3);
    CHECK(l.to == 5);
}

TEST_CASE("A king two squares over with its rook still home waits") {
    auto m = classify_move(castle_board(),
                           batch_of({{3, Piece::Empty}, {1, Piece::WhiteKing}}));
    CHECK(m.kind == MoveKind::NotClassified);

    // One square is an ordinary king move.
    m = classify_move(castle_board(), batch_of({{3, Piece::Empty}, {2, Piece::WhiteKing}}));
    CHECK(m.kind == MoveKind::SimpleMove);
}

TEST_CASE("Rook moved first: the king's two-square hop completes the castle") {
    // Rook already on 2 from an earlier batch, corner 0 empty.
    BoardState b = castle_board();
    b[0] = Piece::Empty;
    b[2] = Piece::WhiteRook;
    auto s = classify_move(b, batch_of({{3, Piece::Empty}, {1, Piece::WhiteKing}}));
    CHECK(s.kind == MoveKind::ShortCastle);
    CHECK(s.from == 3);
    CHECK(s.to == 1);
    CHECK(s.piece == Piece::WhiteKing);

    b = castle_board();
    b[7] = Piece::Empty;
    b[4] = Piece::WhiteRook;
    auto l = classify_move(b, batch_of({{3, Piece::Empty}, {5, Piece::WhiteKing}}));
    CHECK(l.kind == MoveKind::LongCastle);
    CHECK(l.to == 5);
}

TEST_CASE("A king two squares over with no rook on that side is a simple move") {
    BoardState b = empty_board();
    b[3] = Piece::WhiteKing;
    b[59] = Piece::BlackKing;
    auto m = classify_move(b, batch_of({{3, Piece::Empty}, {1, Piece::WhiteKing}}));
    CHECK(m.kind == MoveKind::SimpleMove);
    CHECK(m.from == 3);
    CHECK(m.to == 1);

    // An enemy rook on the corner does not hold the move open.
    b[0] = Piece::BlackRook;
    m = classify_move(b, batch_of({{3, Piece::Empty}, {1, Piece::WhiteKing}}));
    CHECK(m.kind == MoveKind::SimpleMove);

    // Endgame king walk in the middle of the board.
    BoardState e = empty_board();
    e[27] = Piece::BlackKing;
    e[3] = Piece::WhiteKing;
    m = classify_move(e, batch_of({{27, Piece::Empty}, {29, Piece::BlackKing}}));
    CHECK(m.kind == MoveKind::SimpleMove);
}

TEST_CASE("Out-of-range updates are ignored") {
    auto m = classify_move(standard_start(),
                           batch_of({{1, Piece::Empty}, {70, Piece::WhiteQueen},
                                     {18, Piece::WhiteKnight}}));
    CHECK(m.kind == MoveKind::SimpleMove);
    CHECK(std::string(move_kind_name(MoveKind::LongCastle)) == "long_castle");
}
