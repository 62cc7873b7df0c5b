#include "movepick.h"
#include <algorithm>

const int MVV_LVA[6][6] = {
    // aggressor: P   N   B   R   Q   K
    {15, 14, 13, 12, 11, 10},  // victim P
    {25, 24, 23, 22, 21, 20},  // victim N
    {35, 34, 33, 32, 31, 30},  // victim B
    {45, 44, 43, 42, 41, 40},  // victim R
    {55, 54, 53, 52, 51, 50},  // victim Q
    { 0,  0,  0,  0,  0,  0},  // victim K
};

bool isPassedPawnPush(const chess::Board& board, const chess::Move& move) {
    chess::Piece mover = board.at(move.from());
    if (mover.type() != chess::PieceType::PAWN) return false;

    const bool white = mover.color() == chess::Color::WHITE;
    const chess::Piece enemy_pawn(chess::PieceType::PAWN,
                                  white ? chess::Color::BLACK : chess::Color::WHITE);
    const int to_file = move.to().index() & 7;
    const int to_rank = move.to().index() >> 3;

    for (int f = std::max(0, to_file - 1); f <= std::min(7, to_file + 1); ++f) {
        for (int r = white ? to_rank + 1 : to_rank - 1; white ? r < 8 : r >= 0; r += white ? 1 : -1) {
            if (board.at(chess::Square(r * 8 + f)) == enemy_pawn) return false;
        }
    }
    return true;
}

static int pawnPushBonus(const chess::Board& board, const chess::Move& move, chess::Color us) {
    int score = 0;
    const int from_file = move.from().index() & 7;
    const int to_rank = move.to().index() >> 3;

    if (from_file == 3 || from_file == 4) score += ORDER_CENTER_PAWN;

    // Closer to promotion, larger bonus
    if (us == chess::Color::WHITE && to_rank >= 5) score += to_rank - 4;
    else if (us == chess::Color::BLACK && to_rank <= 2) score += 3 - to_rank;

    if (isPassedPawnPush(board, move)) {
        const int advance = us == chess::Color::WHITE ? to_rank - 1 : 6 - to_rank;
        score += ORDER_PASSED_PAWN_PER_RANK * std::max(0, advance);
    }
    return score;
}

int scoreMove(chess::Board& board, const chess::Move& move, const OrderingContext& ctx) {
    if (ctx.hint != chess::Move() && move == ctx.hint)
        return ORDER_HINT_BONUS;

    if (ctx.killers) {
        int killer_score = ctx.killers->get_killer_score(ctx.ply, move);
        if (killer_score > 0)
            return ORDER_KILLER_BONUS + killer_score * 1000;
    }

    const chess::Color us = board.sideToMove();
    const chess::Piece mover = board.at(move.from());
    int score = 0;

    if (board.isCapture(move)) {
        chess::PieceType victim = move.typeOf() == chess::Move::ENPASSANT
                                      ? chess::PieceType(chess::PieceType::PAWN)
                                      : board.at(move.to()).type();
        chess::PieceType aggressor = mover.type();
        int v = static_cast<int>(victim);
        int a = static_cast<int>(aggressor);

        score += MVV_LVA[v][a];
        score += pieceValue(victim) - pieceValue(aggressor) / 100;
        if (!board.isAttacked(move.to(), oppColor(us)))
            score += ORDER_UNDEFENDED_CAPTURE;
    }

    if (isPromotion(move))
        score += pieceValue(move.promotionType()) - pieceValue(chess::PieceType::PAWN);

    board.makeMove(move);
    const bool gives_check = board.inCheck();
    board.unmakeMove(move);
    if (gives_check) score += ORDER_CHECK_BONUS;

    if (mover.type() == chess::PieceType::PAWN)
        score += pawnPushBonus(board, move, us);

    if (ctx.history && isQuietMove(board, move))
        score += std::min(ctx.history->get(move) / ORDER_HISTORY_DIVISOR, ORDER_HISTORY_MAX_BONUS);

    return score;
}

std::vector<ScoredMove> orderMoves(chess::Board& board, const chess::Movelist& moves,
                                   const OrderingContext& ctx) {
    std::vector<ScoredMove> scored;
    scored.reserve(moves.size());
    for (const auto& move : moves)
        scored.emplace_back(move, scoreMove(board, move, ctx));

    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredMove& a, const ScoredMove& b) { return a.score > b.score; });
    return scored;
}
