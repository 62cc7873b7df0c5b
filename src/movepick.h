#pragma once

#include "history.h"
#include "types.h"
#include <chess.hpp>
#include <vector>

// Hints handed to the orderer. All fields are optional.
struct OrderingContext {
    chess::Move hint = chess::Move();           // cached or previous-iteration best move
    const KillerMoves* killers = nullptr;
    const ButterflyHistory* history = nullptr;
    int ply = 0;

    OrderingContext() = default;
    OrderingContext(chess::Move h, const KillerMoves* k, const ButterflyHistory* hist, int p)
        : hint(h), killers(k), history(hist), ply(p) {}
};

// Indexed [victim][aggressor] in PieceType order
extern const int MVV_LVA[6][6];

// Heuristic score of one legal move. The board is used for a speculative
// make/unmake to detect checks and is unchanged on return.
int scoreMove(chess::Board& board, const chess::Move& move, const OrderingContext& ctx);

bool isPassedPawnPush(const chess::Board& board, const chess::Move& move);

// Best candidates first; equal scores keep generation order.
std::vector<ScoredMove> orderMoves(chess::Board& board, const chess::Movelist& moves,
                                   const OrderingContext& ctx);
