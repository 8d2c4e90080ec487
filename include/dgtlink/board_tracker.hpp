#pragma once
/**
 * @file board_tracker.hpp
 * @brief Board Tracker, the one owner of the live 64-square board.
 *
 * @details
 * ## What it does
 * The tracker is seeded from a full board dump and then changed one square at
 * a time by field updates. Nothing else writes to the board. Every instance is
 * independent; there is no shared or global board.
 *
 * ## Start-position classification
 * `classify()` compares the current board with the two layouts the board can
 * show before a game:
 *
 * - **Normal**: squares 0..7 are White's back rank in the order
 *   Rook, Knight, Bishop, King, Queen, Bishop, Knight, Rook; 8..15 white
 *   pawns; 48..55 black pawns; 56..63 the same sequence in black.
 * - **Mirror**: Black's back rank on squares 0..7. Two forms are accepted:
 *   the Normal layout rotated by 180 degrees (Queen before King on both back
 *   ranks, see mirror_start()) and the Normal layout with the colors swapped
 *   (King before Queen).
 * - **None**: anything else, and immediately if any of 16..47 holds a piece.
 *
 * The King/Queen order above is what the board reports for its start
 * position; it is compared literally and is not a statement about chess
 * rules.
 *
 * Classification is computed from the board on every call. It is never
 * cached, so it can never be stale after apply().
 *
 * @code
 * dgtlink::BoardTracker tracker(dump.board);
 * tracker.apply({8, dgtlink::Piece::Empty});
 * tracker.apply({16, dgtlink::Piece::WhitePawn});
 * tracker.classify();   // StartingClassification::None
 * @endcode
 */
#include <cstdint>
#include <string>
#include <vector>

#include "dgtlink/board.hpp"

namespace dgtlink {

enum class StartingClassification : uint8_t { None, Normal, Mirror };

const char* start_position_name(StartingClassification c);

/// Pure classification of any board; BoardTracker::classify() forwards here.
StartingClassification classify_board(const BoardState& board);

class BoardTracker {
public:
    /// Starts from an all-empty board.
    BoardTracker();

    /// Starts from a decoded board dump.
    explicit BoardTracker(const BoardState& initial);

    /**
     * @brief Replace exactly one square.
     *
     * @return true when applied; false (board untouched) when
     *         `update.square >= 64`.
     */
    bool apply(const SquareUpdate& update);

    /// Replace the whole board, e.g. when a fresh dump arrives.
    void reset(const BoardState& board);

    StartingClassification classify() const;

    const BoardState& board() const { return board_; }

    /// Piece on @p square; Empty for out-of-range squares.
    Piece at(uint8_t square) const;

    /// Number of updates applied since construction or the last reset().
    uint32_t updates_applied() const { return updates_applied_; }

    /**
     * @brief Eight rows of eight piece characters, square 0 first.
     *
     * Empty squares render as '.', so rows are readable in a terminal.
     */
    std::vector<std::string> render_rows() const;

private:
    BoardState board_;
    uint32_t   updates_applied_{0};
};

} // namespace dgtlink
