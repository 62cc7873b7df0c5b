#include "tt.h"
#include "types.h"
#include <algorithm>

TranspositionTable::TranspositionTable(size_t mb) {
    resize(mb);
}

void TranspositionTable::resize(size_t mb) {
    mb = std::clamp<size_t>(mb, 1, MAX_HASH_MB);
    size_t bytes = mb * 1024 * 1024;
    size_t count = bytes / sizeof(TTEntry);
    size_t power = 1;
    while (power * 2 <= count) power *= 2;

    entries.assign(power, TTEntry());
    mask = power - 1;
    mb_ = mb;
}

void TranspositionTable::clear() {
    std::fill(entries.begin(), entries.end(), TTEntry());
}

void TranspositionTable::store(uint64_t key, int depth, int score, chess::Move best_move,
                               TTFlag flag, int ply_from_root) {
    TTEntry& entry = entries[key & mask];

    // Mate scores are kept relative to this node, not to the root
    int stored_score = score;
    if (score >= MATE_BOUND) stored_score = score + ply_from_root;
    else if (score <= -MATE_BOUND) stored_score = score - ply_from_root;

    entry.key = key;
    entry.depth = static_cast<int16_t>(depth);
    entry.score = static_cast<int16_t>(stored_score);
    entry.best_move = best_move;
    entry.flag = flag;
}

bool TranspositionTable::probe(uint64_t key, int depth, int alpha, int beta, int& score,
                               chess::Move& tt_move, int ply_from_root) const {
    const TTEntry& entry = entries[key & mask];

    if (entry.key != key || entry.depth < 0) {
        tt_move = chess::Move();
        return false;
    }

    tt_move = entry.best_move;

    if (entry.depth < depth) return false;

    int retrieved = entry.score;
    if (retrieved >= MATE_BOUND) retrieved -= ply_from_root;
    else if (retrieved <= -MATE_BOUND) retrieved += ply_from_root;

    if (entry.flag == TT_EXACT) { score = retrieved; return true; }
    if (entry.flag == TT_LOWER && retrieved >= beta) { score = retrieved; return true; }
    if (entry.flag == TT_UPPER && retrieved <= alpha) { score = retrieved; return true; }
    return false;
}

bool TranspositionTable::peek(uint64_t key, TTEntry& out) const {
    const TTEntry& e = entries[key & mask];
    if (e.key != key || e.depth < 0) return false;
    out = e;
    return true;
}

int TranspositionTable::hashfull() const {
    const size_t sample = std::min<size_t>(1000, entries.size());
    if (sample == 0) return 0;
    size_t used = 0;
    for (size_t i = 0; i < sample; ++i)
        if (entries[i].depth >= 0) ++used;
    return static_cast<int>(used * 1000 / sample);
}
