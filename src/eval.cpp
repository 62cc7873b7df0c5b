#include "eval.h"
#include "psqt.h"
#include "rules.h"
#include "types.h"

bool isEndgame(const chess::Board& board) {
    using chess::Color;
    using chess::PieceType;

    auto both = [&](PieceType pt) {
        return board.pieces(pt, Color::WHITE).count() + board.pieces(pt, Color::BLACK).count();
    };

    const int queens = both(PieceType::QUEEN);
    const int rooks  = both(PieceType::ROOK);
    const int minors = both(PieceType::KNIGHT) + both(PieceType::BISHOP);

    if (queens == 0) return true;
    return queens <= ENDGAME_MAX_QUEENS && rooks <= ENDGAME_MAX_ROOKS &&
           minors <= ENDGAME_MAX_MINORS;
}

EvalTrace traceEval(chess::Board& board) {
    EvalTrace t;

    const chess::Color us = board.sideToMove();
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);

    if (moves.empty()) {
        t.terminal = true;
        if (board.inCheck())
            t.total = us == chess::Color::WHITE ? -MATE_SCORE : MATE_SCORE;
        else
            t.total = DRAW_SCORE;
        return t;
    }
    if (isDrawByRule(board)) {
        t.terminal = true;
        t.total = DRAW_SCORE;
        return t;
    }

    t.endgame = isEndgame(board);

    for (int i = 0; i < 64; ++i) {
        chess::Square sq(i);
        chess::Piece piece = board.at(sq);
        if (piece == chess::Piece::NONE) continue;

        const int sign = piece.color() == chess::Color::WHITE ? 1 : -1;
        if (piece.type() != chess::PieceType::KING)
            t.material += sign * pieceValue(piece.type());
        t.positional += sign * psqtValue(piece, sq, t.endgame);
    }

    const int our_moves = static_cast<int>(moves.size());
    const int their_moves = legalMoveCount(board, oppColor(us));
    const int white_moves = us == chess::Color::WHITE ? our_moves : their_moves;
    const int black_moves = us == chess::Color::WHITE ? their_moves : our_moves;
    t.mobility = (white_moves - black_moves) * MOBILITY_WEIGHT;

    t.total = t.material + t.positional + t.mobility;
    return t;
}

int evaluate(chess::Board& board) {
    return traceEval(board).total;
}

int signedEval(chess::Board& board) {
    const int score = evaluate(board);
    return board.sideToMove() == chess::Color::WHITE ? score : -score;
}
