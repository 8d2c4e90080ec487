#pragma once
/**
 * @file board.hpp
 * @brief Board value types shared by the decoder, the tracker and the classifier.
 *
 * @details
 * A BoardState is exactly 64 Piece values indexed 0..63 in the order the
 * device delivers them (rank-major). Nothing in dgtlink reinterprets rank or
 * file; square 0 is whatever the hardware calls square 0.
 *
 * Because BoardState holds Piece and not raw bytes, an invalid piece byte can
 * never reach a board: decoding fails first.
 */

#include <array>
#include <cstdint>

#include "dgtlink/piece.hpp"

namespace dgtlink {

static constexpr uint8_t BOARD_SQUARES = 64;

using BoardState = std::array<Piece, BOARD_SQUARES>;

/**
 * @brief One square changed: the board now holds @ref piece at @ref square.
 *
 * square is 0..63 once it has passed the decoder; consumers still bounds-check.
 */
struct SquareUpdate {
    uint8_t square{0};
    Piece   piece{Piece::Empty};
};

inline bool operator==(const SquareUpdate& a, const SquareUpdate& b) {
    return a.square == b.square && a.piece == b.piece;
}
inline bool operator!=(const SquareUpdate& a, const SquareUpdate& b) { return !(a == b); }

/// All 64 squares empty.
BoardState empty_board();

/**
 * @brief Layout recognized as the Normal start.
 *
 * Squares 0..7 hold White's back rank as Rook, Knight, Bishop, King, Queen,
 * Bishop, Knight, Rook; 8..15 white pawns; 48..55 black pawns; 56..63 the
 * same piece sequence in black.
 */
BoardState standard_start();

/**
 * @brief Layout recognized as the Mirror start (board turned 180 degrees).
 *
 * Squares 0..7 hold Black's back rank as Rook, Knight, Bishop, Queen, King,
 * Bishop, Knight, Rook; 8..15 black pawns; 48..55 white pawns; 56..63 the
 * same sequence in white.
 */
BoardState mirror_start();

} // namespace dgtlink
