#include "rules.h"

// Incremental Zobrist key maintained by the board: placement, side to move,
// castling rights and en passant file all feed it.
uint64_t positionKey(const chess::Board& board) {
    return board.hash();
}

static bool hasLegalMove(const chess::Board& board) {
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    return !moves.empty();
}

bool isCheckmate(const chess::Board& board) {
    return board.inCheck() && !hasLegalMove(board);
}

bool isStalemate(const chess::Board& board) {
    return !board.inCheck() && !hasLegalMove(board);
}

bool isInsufficientMaterial(const chess::Board& board) {
    return board.isInsufficientMaterial();
}

bool isFiftyMoveDraw(const chess::Board& board) {
    if (board.halfMoveClock() < 100) return false;
    // Mate delivered on the hundredth half move still counts as mate
    return !isCheckmate(board);
}

bool isRepetition(const chess::Board& board, int count) {
    return board.isRepetition(count);
}

bool isDrawByRule(const chess::Board& board, int repetitions) {
    return isRepetition(board, repetitions) ||
           isFiftyMoveDraw(board) ||
           isInsufficientMaterial(board);
}

int legalMoveCount(chess::Board& board, chess::Color side) {
    chess::Movelist moves;
    if (board.sideToMove() == side) {
        chess::movegen::legalmoves(moves, board);
        return static_cast<int>(moves.size());
    }

    board.makeNullMove();
    chess::movegen::legalmoves(moves, board);
    // With the mover in check the passed side could "take" the king
    int count = 0;
    for (const auto& move : moves)
        if (board.at(move.to()).type() != chess::PieceType::KING) ++count;
    board.unmakeNullMove();
    return count;
}
