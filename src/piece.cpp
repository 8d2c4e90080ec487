// ============================================================================
// piece.cpp : implementation for dgtlink/piece.hpp
// Every mapping below is an explicit switch so the compiler can flag a
// missing enumerator, and every byte path ends in a defined answer.
// ============================================================================

#include "dgtlink/piece.hpp"

namespace dgtlink {

std::optional<Piece> piece_from_byte(uint8_t b) {
    switch (b) {
        case 0x00: return Piece::Empty;
        case 0x01: return Piece::WhitePawn;
        case 0x02: return Piece::WhiteRook;
        case 0x03: return Piece::WhiteKnight;
        case 0x04: return Piece::WhiteBishop;
        case 0x05: return Piece::WhiteKing;
        case 0x06: return Piece::WhiteQueen;
        case 0x07: return Piece::BlackPawn;
        case 0x08: return Piece::BlackRook;
        case 0x09: return Piece::BlackKnight;
        case 0x0A: return Piece::BlackBishop;
        case 0x0B: return Piece::BlackKing;
        case 0x0C: return Piece::BlackQueen;
        default:   return std::nullopt;   // 0x0D..0xFF: not a piece
    }
}


uint8_t piece_to_byte(Piece p) {
    return static_cast<uint8_t>(p);
}


char piece_to_char(Piece p) {
    switch (p) {
        case Piece::Empty:       return ' ';
        case Piece::WhitePawn:   return 'P';
        case Piece::WhiteRook:   return 'R';
        case Piece::WhiteKnight: return 'N';
        case Piece::WhiteBishop: return 'B';
        case Piece::WhiteKing:   return 'K';
        case Piece::WhiteQueen:  return 'Q';
        case Piece::BlackPawn:   return 'p';
        case Piece::BlackRook:   return 'r';
        case Piece::BlackKnight: return 'n';
        case Piece::BlackBishop: return 'b';
        case Piece::BlackKing:   return 'k';
        case Piece::BlackQueen:  return 'q';
    }
    return '?';
}


std::optional<Piece> piece_from_char(char c) {
    switch (c) {
        case ' ':
        case '.': return Piece::Empty;
        case 'P': return Piece::WhitePawn;
        case 'R': return Piece::WhiteRook;
        case 'N': return Piece::WhiteKnight;
        case 'B': return Piece::WhiteBishop;
        case 'K': return Piece::WhiteKing;
        case 'Q': return Piece::WhiteQueen;
        case 'p': return Piece::BlackPawn;
        case 'r': return Piece::BlackRook;
        case 'n': return Piece::BlackKnight;
        case 'b': return Piece::BlackBishop;
        case 'k': return Piece::BlackKing;
        case 'q': return Piece::BlackQueen;
        default:  return std::nullopt;
    }
}


PieceColor piece_color(Piece p) {
    switch (p) {
        case Piece::Empty:
            return PieceColor::None;
        case Piece::WhitePawn:
        case Piece::WhiteRook:
        case Piece::WhiteKnight:
        case Piece::WhiteBishop:
        case Piece::WhiteKing:
        case Piece::WhiteQueen:
            return PieceColor::White;
        case Piece::BlackPawn:
        case Piece::BlackRook:
        case Piece::BlackKnight:
        case Piece::BlackBishop:
        case Piece::BlackKing:
        case Piece::BlackQueen:
            return PieceColor::Black;
    }
    return PieceColor::None;
}


bool same_color(Piece a, Piece b) {
    return a != Piece::Empty && piece_color(a) == piece_color(b);
}


bool is_pawn(Piece p) { return p == Piece::WhitePawn || p == Piece::BlackPawn; }
bool is_king(Piece p) { return p == Piece::WhiteKing || p == Piece::BlackKing; }
bool is_rook(Piece p) { return p == Piece::WhiteRook || p == Piece::BlackRook; }


const char* piece_name(Piece p) {
    switch (p) {
        case Piece::Empty:       return "empty";
        case Piece::WhitePawn:   return "white_pawn";
        case Piece::WhiteRook:   return "white_rook";
        case Piece::WhiteKnight: return "white_knight";
        case Piece::WhiteBishop: return "white_bishop";
        case Piece::WhiteKing:   return "white_king";
        case Piece::WhiteQueen:  return "white_queen";
        case Piece::BlackPawn:   return "black_pawn";
        case Piece::BlackRook:   return "black_rook";
        case Piece::BlackKnight: return "black_knight";
        case Piece::BlackBishop: return "black_bishop";
        case Piece::BlackKing:   return "black_king";
        case Piece::BlackQueen:  return "black_queen";
    }
    return "unknown";
}

} // namespace dgtlink
