#pragma once

#include <chess.hpp>

// Piece-square tables, 64 entries each, index 0 = a1, White's point of view.
// Indexed by piece type: PAWN, KNIGHT, BISHOP, ROOK, QUEEN, KING.
extern const int* pst_middlegame[6];
extern const int* pst_endgame[6];

// Positional bonus of `piece` standing on `sq`; Black reads the mirrored square.
int psqtValue(chess::Piece piece, chess::Square sq, bool endgame);
