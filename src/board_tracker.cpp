/**
 * @file board_tracker.cpp
 * @brief Implementation of dgtlink::BoardTracker.
 *
 * @see board_tracker.hpp for the classification rules.
 */

#include "dgtlink/board_tracker.hpp"

#include <algorithm>

namespace dgtlink {

namespace {

// Back-rank piece sequences, indexed by file as delivered by the board.
constexpr Piece WHITE_BACK_KQ[8] = {
    Piece::WhiteRook, Piece::WhiteKnight, Piece::WhiteBishop, Piece::WhiteKing,
    Piece::WhiteQueen, Piece::WhiteBishop, Piece::WhiteKnight, Piece::WhiteRook
};
constexpr Piece BLACK_BACK_KQ[8] = {
    Piece::BlackRook, Piece::BlackKnight, Piece::BlackBishop, Piece::BlackKing,
    Piece::BlackQueen, Piece::BlackBishop, Piece::BlackKnight, Piece::BlackRook
};
constexpr Piece WHITE_BACK_QK[8] = {
    Piece::WhiteRook, Piece::WhiteKnight, Piece::WhiteBishop, Piece::WhiteQueen,
    Piece::WhiteKing, Piece::WhiteBishop, Piece::WhiteKnight, Piece::WhiteRook
};
constexpr Piece BLACK_BACK_QK[8] = {
    Piece::BlackRook, Piece::BlackKnight, Piece::BlackBishop, Piece::BlackQueen,
    Piece::BlackKing, Piece::BlackBishop, Piece::BlackKnight, Piece::BlackRook
};

bool all_of(const BoardState& b, int first, int last, Piece p) {
    return std::all_of(b.begin() + first, b.begin() + last,
                       [p](Piece x) { return x == p; });
}

bool rank_equals(const BoardState& b, int first, const Piece (&seq)[8]) {
    return std::equal(b.begin() + first, b.begin() + first + 8, seq);
}

// near_pawn fills 8..15, far_pawn fills 48..55; near_back sits on 0..7.
bool layout_matches(const BoardState& b,
                    Piece near_pawn, Piece far_pawn,
                    const Piece (&near_back)[8], const Piece (&far_back)[8]) {
    return all_of(b, 8, 16, near_pawn) &&
           all_of(b, 48, 56, far_pawn) &&
           rank_equals(b, 0, near_back) &&
           rank_equals(b, 56, far_back);
}

} // namespace


const char* start_position_name(StartingClassification c) {
    switch (c) {
        case StartingClassification::None:   return "none";
        case StartingClassification::Normal: return "normal";
        case StartingClassification::Mirror: return "mirror";
    }
    return "unknown";
}


StartingClassification classify_board(const BoardState& b) {
    // A start position always has an empty centre.
    if (!all_of(b, 16, 48, Piece::Empty)) return StartingClassification::None;

    if (layout_matches(b, Piece::WhitePawn, Piece::BlackPawn, WHITE_BACK_KQ, BLACK_BACK_KQ))
        return StartingClassification::Normal;

    if (layout_matches(b, Piece::BlackPawn, Piece::WhitePawn, BLACK_BACK_QK, WHITE_BACK_QK) ||
        layout_matches(b, Piece::BlackPawn, Piece::WhitePawn, BLACK_BACK_KQ, WHITE_BACK_KQ))
        return StartingClassification::Mirror;

    return StartingClassification::None;
}


BoardTracker::BoardTracker() : board_(empty_board()) {}

BoardTracker::BoardTracker(const BoardState& initial) : board_(initial) {}


bool BoardTracker::apply(const SquareUpdate& update) {
    if (update.square >= BOARD_SQUARES) return false;
    board_[update.square] = update.piece;
    ++updates_applied_;
    return true;
}


void BoardTracker::reset(const BoardState& board) {
    board_ = board;
    updates_applied_ = 0;
}


StartingClassification BoardTracker::classify() const {
    return classify_board(board_);
}


Piece BoardTracker::at(uint8_t square) const {
    return square < BOARD_SQUARES ? board_[square] : Piece::Empty;
}


std::vector<std::string> BoardTracker::render_rows() const {
    std::vector<std::string> rows;
    rows.reserve(8);
    for (int r = 0; r < 8; ++r) {
        std::string row;
        row.reserve(8);
        for (int f = 0; f < 8; ++f) {
            const Piece p = board_[r * 8 + f];
            row.push_back(p == Piece::Empty ? '.' : piece_to_char(p));
        }
        rows.push_back(row);
    }
    return rows;
}

} // namespace dgtlink
