#pragma once

#include "config.h"
#include <chess.hpp>
#include <cstdint>
#include <vector>

enum TTFlag : uint8_t { TT_EXACT = 0, TT_LOWER = 1, TT_UPPER = 2 };

struct TTEntry {
    uint64_t key = 0;
    int16_t depth = -1;
    int16_t score = 0;
    chess::Move best_move = chess::Move();
    TTFlag flag = TT_EXACT;
};

// Fixed-size, always-replace table. An entry answers a query only when it
// was searched at least as deep as the query asks for.
class TranspositionTable {
public:
    explicit TranspositionTable(size_t mb = DEFAULT_HASH_MB);

    void resize(size_t mb);
    void clear();

    void store(uint64_t key, int depth, int score, chess::Move best_move,
               TTFlag flag, int ply_from_root);

    // True when the entry decides this node: `score` is then set. `tt_move`
    // receives the stored best move whenever the key matches.
    bool probe(uint64_t key, int depth, int alpha, int beta, int& score,
               chess::Move& tt_move, int ply_from_root) const;

    bool peek(uint64_t key, TTEntry& out) const;

    size_t size() const { return entries.size(); }
    size_t megabytes() const { return mb_; }
    // Permille of the first thousand slots in use
    int hashfull() const;

private:
    std::vector<TTEntry> entries;
    size_t mask = 0;
    size_t mb_ = 0;
};
