#pragma once

#include "config.h"
#include <chess.hpp>
#include <vector>

// Utility functions
inline chess::Color oppColor(chess::Color c) {
    return c == chess::Color::WHITE ? chess::Color::BLACK : chess::Color::WHITE;
}

// Nominal king value only matters for capture ordering, material skips kings.
inline int pieceValue(chess::PieceType pt) {
    static const int values[] = {100, 320, 330, 500, 900, 20000};
    int idx = static_cast<int>(pt);
    return (idx >= 0 && idx < 6) ? values[idx] : 0;
}

inline bool isPromotion(const chess::Move& move) {
    return move.typeOf() == chess::Move::PROMOTION;
}

// Quiet = neither a capture nor a promotion. Castling counts as quiet.
inline bool isQuietMove(const chess::Board& board, const chess::Move& move) {
    return !board.isCapture(move) && !isPromotion(move);
}

struct ScoredMove {
    chess::Move move = chess::Move();
    int score = 0;

    ScoredMove() = default;
    ScoredMove(const chess::Move& m, int s) : move(m), score(s) {}
};

struct SearchStats {
    uint64_t nodes = 0;
    int depth = 0;
    int best_score = 0;
    chess::Move best_move = chess::Move();
    int64_t elapsed_ms = 0;

    void reset() { *this = SearchStats(); }
};

// Per-depth progress event handed to the session callback
struct SearchInfo {
    int depth = 0;
    int score = 0;
    uint64_t nodes = 0;
    uint64_t nps = 0;
    int64_t time_ms = 0;
    int hashfull = 0;
    std::vector<chess::Move> pv;
};
