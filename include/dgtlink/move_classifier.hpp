#pragma once
/**
 * @file move_classifier.hpp
 * @brief Group a burst of square updates into one chess move (best effort).
 *
 * @details
 * PURPOSE
 * -------
 * A physical move on the board arrives as several FieldUpdate messages: a
 * piece is lifted (square -> Empty), maybe a victim is lifted, the piece is
 * set down. classify_move() looks at such a batch against the board as it
 * was before the batch and names the move, when it can.
 *
 * DESIGN
 * ------
 * - The batch is replayed on a copy of the snapshot; only the net effect
 *   counts. A piece lifted and put back on the same square cancels out.
 * - Vacated squares: occupied before, empty after.
 *   Occupied squares: non-empty after and different from before.
 * - The rules are narrow. Anything that does not fit one of them
 *   is NotClassified. There is no legality checking and no notion of whose
 *   turn it is.
 * - Batch and square sets are fixed-capacity ETL vectors: no heap, and a
 *   batch can never grow without bound on a noisy board.
 *
 * RULES
 * -----
 * | vacated | occupied | condition                                   | kind              |
 * |---------|----------|---------------------------------------------|-------------------|
 * | 1       | 1        | same piece, destination was empty           | SimpleMove        |
 * | 1       | 1        | same piece, destination held an opponent    | SimpleCapture     |
 * | 1       | 1        | as above but the mover is a pawn            | PawnCapture       |
 * | 2       | 1        | pawn to empty square, adjacent pawn removed | PawnCapture       |
 * | 1       | 1        | pawn turns into own piece on an end rank    | Promotion         |
 * | 1       | 1        | as above onto an opponent                   | PromotionCapture  |
 * | 2       | 2        | own king and rook both relocated            | Short/LongCastle  |
 *
 * Two half-finished moves stay NotClassified until the next update:
 * a king two squares along its rank while an own rook still stands on that
 * side's corner three or four files from the king (castling), and a pawn
 * moved sideways onto an empty square with the victim still standing
 * (en passant). A king two squares over whose rook already stands on the
 * square it crossed completes the castle; with no such rook it is a
 * SimpleMove.
 */

#include <cstddef>
#include <cstdint>

#include "etl/vector.h"

#include "dgtlink/board.hpp"

namespace dgtlink {

static constexpr std::size_t UPDATE_BATCH_CAP = 32;

using UpdateBatch = etl::vector<SquareUpdate, UPDATE_BATCH_CAP>;
using SquareSet   = etl::vector<uint8_t, BOARD_SQUARES>;

enum class MoveKind : uint8_t {
    NotClassified,
    SimpleMove,
    SimpleCapture,
    PawnCapture,
    Promotion,
    PromotionCapture,
    ShortCastle,
    LongCastle
};

const char* move_kind_name(MoveKind k);

/**
 * @brief Outcome of classify_move().
 *
 * For castles, @ref from / @ref to describe the king and @ref piece is the king.
 * @ref captured is Empty unless a piece was taken.
 */
struct MoveResult {
    MoveKind kind{MoveKind::NotClassified};
    uint8_t  from{0};
    uint8_t  to{0};
    Piece    piece{Piece::Empty};
    Piece    captured{Piece::Empty};
};

/**
 * @brief Net square changes between two boards.
 *
 * Squares are listed in ascending order.
 */
void diff_boards(const BoardState& before, const BoardState& after,
                 SquareSet& vacated, SquareSet& occupied);

/**
 * @brief Name the move that turns @p before into @p before + @p batch.
 *
 * Updates with square >= 64 are ignored.
 */
MoveResult classify_move(const BoardState& before, const UpdateBatch& batch);

} // namespace dgtlink
