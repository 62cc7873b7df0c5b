#pragma once

#include <chess.hpp>
#include <cstdint>

// Thin layer over chess.hpp for the questions search and eval ask.

uint64_t positionKey(const chess::Board& board);

bool isCheckmate(const chess::Board& board);
bool isStalemate(const chess::Board& board);
bool isInsufficientMaterial(const chess::Board& board);
bool isFiftyMoveDraw(const chess::Board& board);

// count = 2 is the threefold claim, count = 1 flags any earlier occurrence
bool isRepetition(const chess::Board& board, int count = 2);

// Draws that do not need move generation (repetition, fifty moves, material).
bool isDrawByRule(const chess::Board& board, int repetitions = 2);

// Legal moves for `side`, whoever is to move. Uses a paired null move when
// `side` is not on move; the board is unchanged on return. Captures of the
// king are not counted.
int legalMoveCount(chess::Board& board, chess::Color side);
