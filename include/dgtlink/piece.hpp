#pragma once
/**
 * @file piece.hpp
 * @brief Piece codec: one wire byte <-> one of thirteen piece identities.
 *
 * @details
 * The board reports every square as a single byte. Values 0x00..0x0C name a
 * piece (or the empty square); everything else is garbage from a noisy link
 * and must never become a Piece. All conversions here are total: a byte that
 * is not a piece comes back as std::nullopt, never as a silently wrong enum.
 *
 * Wire table:
 * @code
 *   0x00 Empty
 *   0x01 WhitePawn   0x02 WhiteRook   0x03 WhiteKnight
 *   0x04 WhiteBishop 0x05 WhiteKing   0x06 WhiteQueen
 *   0x07 BlackPawn   0x08 BlackRook   0x09 BlackKnight
 *   0x0A BlackBishop 0x0B BlackKing   0x0C BlackQueen
 * @endcode
 *
 * Text rendering follows FEN letters (uppercase white, lowercase black) with
 * a blank for the empty square. No two identities share a character.
 */

#include <cstdint>
#include <optional>

namespace dgtlink {

/// Piece identity as sent by the board. Enumerator values are the wire bytes.
enum class Piece : uint8_t {
    Empty       = 0x00,
    WhitePawn   = 0x01,
    WhiteRook   = 0x02,
    WhiteKnight = 0x03,
    WhiteBishop = 0x04,
    WhiteKing   = 0x05,
    WhiteQueen  = 0x06,
    BlackPawn   = 0x07,
    BlackRook   = 0x08,
    BlackKnight = 0x09,
    BlackBishop = 0x0A,
    BlackKing   = 0x0B,
    BlackQueen  = 0x0C
};

/// Side a piece belongs to. The empty square has no color.
enum class PieceColor : uint8_t { None, White, Black };

/// Number of distinct identities, Empty included.
static constexpr int PIECE_COUNT = 13;

/**
 * @brief Decode a wire byte into a Piece.
 * @return The piece for 0x00..0x0C, std::nullopt for any other byte.
 */
std::optional<Piece> piece_from_byte(uint8_t b);

/// Wire byte for a piece (the enumerator value).
uint8_t piece_to_byte(Piece p);

/// FEN-style character: ' ' for Empty, "PRNBKQ" white, "prnbkq" black.
char piece_to_char(Piece p);

/// Inverse of piece_to_char(); '.' is accepted as an alias for Empty.
std::optional<Piece> piece_from_char(char c);

PieceColor piece_color(Piece p);

/**
 * @brief True when @p a is a piece and @p b has the same color.
 *
 * An empty @p a is never "the same color" as anything, including another
 * empty square.
 */
bool same_color(Piece a, Piece b);

bool is_pawn(Piece p);
bool is_king(Piece p);
bool is_rook(Piece p);

/// Short lowercase name for logs ("white_pawn", "empty", ...).
const char* piece_name(Piece p);

} // namespace dgtlink
