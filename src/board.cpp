#include "dgtlink/board.hpp"

namespace dgtlink {

BoardState empty_board() {
    BoardState b;
    b.fill(Piece::Empty);
    return b;
}


BoardState standard_start() {
    BoardState b = empty_board();
    const Piece white_back[8] = {
        Piece::WhiteRook, Piece::WhiteKnight, Piece::WhiteBishop, Piece::WhiteKing,
        Piece::WhiteQueen, Piece::WhiteBishop, Piece::WhiteKnight, Piece::WhiteRook
    };
    const Piece black_back[8] = {
        Piece::BlackRook, Piece::BlackKnight, Piece::BlackBishop, Piece::BlackKing,
        Piece::BlackQueen, Piece::BlackBishop, Piece::BlackKnight, Piece::BlackRook
    };
    for (int i = 0; i < 8; ++i) {
        b[i]      = white_back[i];
        b[8 + i]  = Piece::WhitePawn;
        b[48 + i] = Piece::BlackPawn;
        b[56 + i] = black_back[i];
    }
    return b;
}


BoardState mirror_start() {
    // standard_start() turned half a circle: square i takes square 63 - i.
    const BoardState normal = standard_start();
    BoardState b;
    for (int i = 0; i < BOARD_SQUARES; ++i) b[i] = normal[BOARD_SQUARES - 1 - i];
    return b;
}

} // namespace dgtlink
