#pragma once

#include "history.h"
#include "timeman.h"
#include "tt.h"
#include "types.h"
#include <chess.hpp>
#include <functional>
#include <vector>

// Everything that survives between searches of one engine instance. A
// session serves one search at a time; the board is mutated in place.
struct SearchSession {
    TranspositionTable tt;
    KillerMoves killers;
    ButterflyHistory history;
    SearchStats stats;

    // Set once the clock runs out; unwinds the recursion
    bool stopped = false;
    // The clock is ignored until one root move has been fully searched
    bool can_stop = false;

    std::function<void(const SearchInfo&)> on_info;

    explicit SearchSession(size_t hash_mb = DEFAULT_HASH_MB) : tt(hash_mb) {}

    SearchSession(const SearchSession&) = delete;
    SearchSession& operator=(const SearchSession&) = delete;

    // Cold start: cache, killers and history
    void clear() {
        tt.clear();
        killers.clear();
        history.clear();
    }
};

// Score from the side to move's point of view. tm may be null (no clock).
int negamax(chess::Board& board, int depth, int alpha, int beta, int ply_from_root,
            SearchSession& session, const TimeManager* tm);

// Iterative deepening up to max_depth under tm. Returns chess::Move() when
// the side to move has no legal move.
chess::Move search(chess::Board& board, int max_depth, SearchSession& session, TimeManager& tm);

// time_budget_ms <= 0 means no time limit
chess::Move findBestMove(chess::Board& board, int max_depth, int64_t time_budget_ms,
                         SearchSession& session);

std::vector<chess::Move> extractPV(chess::Board board, int max_depth, const TranspositionTable& tt);
