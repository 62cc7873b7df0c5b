#pragma once

#include "config.h"
#include <chess.hpp>
#include <cstring>

// From-to history of quiet moves that produced cutoffs. Rewards are depth^2
// and the table only grows until cleared, saturating at HISTORY_MAX.
struct ButterflyHistory {
    int32_t table[64][64];

    ButterflyHistory() { clear(); }
    void clear() { std::memset(table, 0, sizeof(table)); }

    int get(chess::Square from, chess::Square to) const {
        return table[from.index()][to.index()];
    }

    int get(const chess::Move& move) const { return get(move.from(), move.to()); }

    void update(chess::Square from, chess::Square to, int depth) {
        int32_t& cur = table[from.index()][to.index()];
        int64_t next = static_cast<int64_t>(cur) + static_cast<int64_t>(depth) * depth;
        cur = static_cast<int32_t>(next > HISTORY_MAX ? HISTORY_MAX : next);
    }
};

// Two quiet cutoff moves per ply, slot 0 the most recent
struct KillerMoves {
    chess::Move killers[MAX_PLY][2];

    KillerMoves() { clear(); }
    void clear();
    void store(int ply, chess::Move move);
    bool is_killer(int ply, chess::Move move) const;
    // 2 for the newest killer, 1 for the older one, 0 otherwise
    int get_killer_score(int ply, chess::Move move) const;
    const chess::Move* at(int ply) const;
};
