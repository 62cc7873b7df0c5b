#pragma once

#include "config.h"
#include <chess.hpp>

// Per-term breakdown, White's point of view
struct EvalTrace {
    int material = 0;
    int positional = 0;
    int mobility = 0;
    bool endgame = false;
    bool terminal = false;
    int total = 0;
};

bool isEndgame(const chess::Board& board);

// Static score in centipawns from White's point of view. Mates score
// +-MATE_SCORE, draws by rule 0. The board is restored before returning.
int evaluate(chess::Board& board);

// evaluate() seen from the side to move
int signedEval(chess::Board& board);

EvalTrace traceEval(chess::Board& board);
