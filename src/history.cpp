#include "history.h"

void KillerMoves::clear() {
    for (int i = 0; i < MAX_PLY; ++i) {
        killers[i][0] = chess::Move();
        killers[i][1] = chess::Move();
    }
}

void KillerMoves::store(int ply, chess::Move move) {
    if (ply < 0 || ply >= MAX_PLY) return;
    if (move == killers[ply][0]) return;
    killers[ply][1] = killers[ply][0];
    killers[ply][0] = move;
}

bool KillerMoves::is_killer(int ply, chess::Move move) const {
    if (ply < 0 || ply >= MAX_PLY || move == chess::Move()) return false;
    return move == killers[ply][0] || move == killers[ply][1];
}

int KillerMoves::get_killer_score(int ply, chess::Move move) const {
    if (!is_killer(ply, move)) return 0;
    return move == killers[ply][0] ? 2 : 1;
}

const chess::Move* KillerMoves::at(int ply) const {
    if (ply < 0 || ply >= MAX_PLY) return nullptr;
    return killers[ply];
}
