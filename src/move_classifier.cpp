/**
 * @file move_classifier.cpp
 * @brief Net-diff rules behind classify_move().
 *
 * @see move_classifier.hpp for the rule table.
 */

#include "dgtlink/move_classifier.hpp"

namespace dgtlink {

namespace {

int rank_of(uint8_t sq) { return sq / 8; }

int distance(uint8_t a, uint8_t b) { return a > b ? a - b : b - a; }

bool opponents(Piece a, Piece b) {
    return a != Piece::Empty && b != Piece::Empty && !same_color(a, b);
}

MoveResult make_result(MoveKind kind, uint8_t from, uint8_t to, Piece piece,
                       Piece captured = Piece::Empty) {
    MoveResult r;
    r.kind = kind;
    r.from = from;
    r.to = to;
    r.piece = piece;
    r.captured = captured;
    return r;
}

// King two files along its rank onto an empty square. With an own rook still
// on that side's corner the castle is in progress. With the rook already on
// the square the king crossed, the rook went first and the castle is done.
// Anything else is a plain king move.
MoveResult classify_king_jump(const BoardState& after, uint8_t from, uint8_t to, Piece king) {
    const uint8_t corner  = to < from ? uint8_t(rank_of(from) * 8) : uint8_t(rank_of(from) * 8 + 7);
    const uint8_t crossed = uint8_t((from + to) / 2);
    const int span = distance(from, corner);

    auto own_rook = [&](uint8_t sq) {
        return is_rook(after[sq]) && same_color(after[sq], king);
    };

    if (span == 3 || span == 4) {
        if (own_rook(corner)) return MoveResult{};
        if (own_rook(crossed))
            return make_result(span == 3 ? MoveKind::ShortCastle : MoveKind::LongCastle,
                               from, to, king);
    }
    return make_result(MoveKind::SimpleMove, from, to, king);
}

// ---------------------------------------------------------------------------
// One square emptied, one square filled.
// ---------------------------------------------------------------------------
MoveResult classify_single(const BoardState& before, const BoardState& after,
                           uint8_t from, uint8_t to) {
    const Piece mover  = before[from];
    const Piece placed = after[to];
    const Piece victim = before[to];

    if (placed == mover) {
        if (victim == Piece::Empty) {
            if (is_king(mover) && rank_of(from) == rank_of(to) && distance(from, to) == 2)
                return classify_king_jump(after, from, to, mover);
            // Pawn sideways onto an empty square: en passant, victim still on the board.
            if (is_pawn(mover) && from % 8 != to % 8)
                return MoveResult{};
            return make_result(MoveKind::SimpleMove, from, to, mover);
        }
        if (opponents(mover, victim)) {
            return make_result(is_pawn(mover) ? MoveKind::PawnCapture : MoveKind::SimpleCapture,
                               from, to, mover, victim);
        }
        return MoveResult{};
    }

    const bool end_rank = rank_of(to) == 0 || rank_of(to) == 7;
    if (is_pawn(mover) && end_rank && same_color(mover, placed) &&
        !is_pawn(placed) && !is_king(placed)) {
        if (victim == Piece::Empty)
            return make_result(MoveKind::Promotion, from, to, placed);
        if (opponents(mover, victim))
            return make_result(MoveKind::PromotionCapture, from, to, placed, victim);
    }
    return MoveResult{};
}

// ---------------------------------------------------------------------------
// Two squares emptied, one filled: en passant.
// ---------------------------------------------------------------------------
MoveResult classify_en_passant(const BoardState& before, const BoardState& after,
                               const SquareSet& vacated, uint8_t to) {
    if (before[to] != Piece::Empty) return MoveResult{};
    const Piece placed = after[to];
    if (!is_pawn(placed)) return MoveResult{};

    for (std::size_t i = 0; i < 2; ++i) {
        const uint8_t from  = vacated[i];
        const uint8_t taken = vacated[1 - i];
        if (before[from] != placed) continue;
        if (!is_pawn(before[taken]) || !opponents(placed, before[taken])) continue;
        // The victim stands beside the mover's origin, on the same rank.
        if (rank_of(taken) != rank_of(from) || distance(taken, from) != 1) continue;
        return make_result(MoveKind::PawnCapture, from, to, placed, before[taken]);
    }
    return MoveResult{};
}

// ---------------------------------------------------------------------------
// Two emptied, two filled: castling.
// ---------------------------------------------------------------------------
MoveResult classify_castle(const BoardState& before, const BoardState& after,
                           const SquareSet& vacated, const SquareSet& occupied) {
    uint8_t king_from = vacated[0];
    uint8_t rook_from = vacated[1];
    if (!is_king(before[king_from])) { king_from = vacated[1]; rook_from = vacated[0]; }

    const Piece king = before[king_from];
    const Piece rook = before[rook_from];
    if (!is_king(king) || !is_rook(rook) || !same_color(king, rook)) return MoveResult{};

    uint8_t king_to = occupied[0];
    uint8_t rook_to = occupied[1];
    if (after[king_to] != king) { king_to = occupied[1]; rook_to = occupied[0]; }
    if (after[king_to] != king || after[rook_to] != rook) return MoveResult{};
    if (before[king_to] != Piece::Empty || before[rook_to] != Piece::Empty) return MoveResult{};

    const int rank = rank_of(king_from);
    if (rank_of(rook_from) != rank || rank_of(king_to) != rank || rank_of(rook_to) != rank)
        return MoveResult{};
    if (distance(king_from, king_to) != 2) return MoveResult{};

    switch (distance(king_from, rook_from)) {
        case 3:  return make_result(MoveKind::ShortCastle, king_from, king_to, king);
        case 4:  return make_result(MoveKind::LongCastle, king_from, king_to, king);
        default: return MoveResult{};
    }
}

} // namespace


const char* move_kind_name(MoveKind k) {
    switch (k) {
        case MoveKind::NotClassified:    return "not_classified";
        case MoveKind::SimpleMove:       return "move";
        case MoveKind::SimpleCapture:    return "capture";
        case MoveKind::PawnCapture:      return "pawn_capture";
        case MoveKind::Promotion:        return "promotion";
        case MoveKind::PromotionCapture: return "promotion_capture";
        case MoveKind::ShortCastle:      return "short_castle";
        case MoveKind::LongCastle:       return "long_castle";
    }
    return "unknown";
}


void diff_boards(const BoardState& before, const BoardState& after,
                 SquareSet& vacated, SquareSet& occupied) {
    vacated.clear();
    occupied.clear();
    for (uint8_t sq = 0; sq < BOARD_SQUARES; ++sq) {
        if (before[sq] != Piece::Empty && after[sq] == Piece::Empty)
            vacated.push_back(sq);
        else if (after[sq] != Piece::Empty && after[sq] != before[sq])
            occupied.push_back(sq);
    }
}


MoveResult classify_move(const BoardState& before, const UpdateBatch& batch) {
    BoardState after = before;
    for (const SquareUpdate& u : batch) {
        if (u.square < BOARD_SQUARES) after[u.square] = u.piece;
    }

    SquareSet vacated;
    SquareSet occupied;
    diff_boards(before, after, vacated, occupied);

    if (vacated.size() == 1 && occupied.size() == 1)
        return classify_single(before, after, vacated[0], occupied[0]);
    if (vacated.size() == 2 && occupied.size() == 1)
        return classify_en_passant(before, after, vacated, occupied[0]);
    if (vacated.size() == 2 && occupied.size() == 2)
        return classify_castle(before, after, vacated, occupied);
    return MoveResult{};
}

} // namespace dgtlink
