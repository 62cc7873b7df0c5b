// src/search.cpp

#include "search.h"
#include "eval.h"
#include "movepick.h"
#include "rules.h"
#include <algorithm>

// ============================================================================
// Helper Functions
// ============================================================================

static inline void pollClock(SearchSession& session, const TimeManager* tm) {
    if (!tm || !session.can_stop || session.stopped) return;
    if ((session.stats.nodes & (TIME_CHECK_INTERVAL - 1)) != 0) return;
    if (tm->should_stop()) session.stopped = true;
}

static bool isLegal(const chess::Board& board, const chess::Move& move) {
    chess::Movelist legal_moves;
    chess::movegen::legalmoves(legal_moves, board);
    return std::find(legal_moves.begin(), legal_moves.end(), move) != legal_moves.end();
}

// ============================================================================
// PV Extraction
// ============================================================================

std::vector<chess::Move> extractPV(chess::Board board, int max_depth, const TranspositionTable& tt) {
    std::vector<chess::Move> pv;

    for (int i = 0; i < max_depth; ++i) {
        TTEntry entry;
        if (!tt.peek(positionKey(board), entry) || entry.best_move == chess::Move()) break;
        if (!isLegal(board, entry.best_move)) break;

        pv.push_back(entry.best_move);
        board.makeMove(entry.best_move);
    }
    return pv;
}

// ============================================================================
// Negamax / Alpha-Beta
// ============================================================================

int negamax(chess::Board& board, int depth, int alpha, int beta, int ply_from_root,
            SearchSession& session, const TimeManager* tm) {
    if (session.stopped) return 0;

    // Draws by rule; inside the tree a single repetition is enough
    if (ply_from_root > 0 && isDrawByRule(board, 1)) return DRAW_SCORE;

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (moves.empty())
        return board.inCheck() ? -MATE_SCORE + ply_from_root : DRAW_SCORE;

    if (depth <= 0 || ply_from_root >= MAX_PLY - 1) {
        session.stats.nodes++;
        pollClock(session, tm);
        return signedEval(board);
    }

    const uint64_t hash = positionKey(board);
    int tt_score = 0;
    chess::Move tt_move = chess::Move();
    if (session.tt.probe(hash, depth, alpha, beta, tt_score, tt_move, ply_from_root))
        return tt_score;

    session.stats.nodes++;
    pollClock(session, tm);
    if (session.stopped) return 0;

    const int original_alpha = alpha;
    OrderingContext ctx(tt_move, &session.killers, &session.history, ply_from_root);
    std::vector<ScoredMove> ordered = orderMoves(board, moves, ctx);

    int best_score = -INF_SCORE;
    chess::Move best_move = ordered.front().move;

    for (const auto& sm : ordered) {
        const chess::Move& move = sm.move;
        const bool is_quiet = isQuietMove(board, move);

        board.makeMove(move);
        int eval = -negamax(board, depth - 1, -beta, -alpha, ply_from_root + 1, session, tm);
        board.unmakeMove(move);

        if (session.stopped) return 0;

        if (eval > best_score) {
            best_score = eval;
            best_move = move;
        }
        if (eval > alpha) alpha = eval;

        // Beta cutoff
        if (alpha >= beta) {
            if (is_quiet) {
                session.killers.store(ply_from_root, move);
                session.history.update(move.from(), move.to(), depth);
            }
            break;
        }
    }

    TTFlag flag = TT_EXACT;
    if (best_score <= original_alpha) flag = TT_UPPER;
    else if (best_score >= beta) flag = TT_LOWER;
    session.tt.store(hash, depth, best_score, best_move, flag, ply_from_root);

    return best_score;
}

// ============================================================================
// Iterative Deepening Search
// ============================================================================

chess::Move search(chess::Board& board, int max_depth, SearchSession& session, TimeManager& tm) {
    session.stats.reset();
    session.killers.clear();
    session.stopped = false;
    session.can_stop = false;

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (moves.empty()) return chess::Move();

    max_depth = std::clamp(max_depth, 1, MAX_PLY - 1);

    const uint64_t root_hash = positionKey(board);
    chess::Move best_move = chess::Move();
    int best_score = -INF_SCORE;

    for (int depth = 1; depth <= max_depth; ++depth) {
        if (depth > 1 && !tm.should_continue_depth()) break;

        OrderingContext ctx(best_move, &session.killers, &session.history, 0);
        std::vector<ScoredMove> root_moves = orderMoves(board, moves, ctx);

        int alpha = -INF_SCORE;
        const int beta = INF_SCORE;
        chess::Move depth_best_move = chess::Move();
        int depth_best_score = -INF_SCORE;

        for (const auto& sm : root_moves) {
            if (session.can_stop && tm.should_stop()) {
                session.stopped = true;
                break;
            }

            board.makeMove(sm.move);
            int eval = -negamax(board, depth - 1, -beta, -alpha, 1, session, &tm);
            board.unmakeMove(sm.move);

            if (session.stopped) break;
            session.can_stop = true;

            if (eval > depth_best_score) {
                depth_best_score = eval;
                depth_best_move = sm.move;
            }
            if (eval > alpha) alpha = eval;
        }

        // Partial depths count too; their first root move is the previous best
        if (depth_best_move != chess::Move()) {
            best_move = depth_best_move;
            best_score = depth_best_score;
        }
        if (session.stopped) break;

        session.tt.store(root_hash, depth, depth_best_score, depth_best_move, TT_EXACT, 0);
        session.stats.depth = depth;

        if (session.on_info) {
            SearchInfo info;
            info.depth = depth;
            info.score = best_score;
            info.nodes = session.stats.nodes;
            info.time_ms = tm.elapsed_ms();
            info.nps = info.time_ms > 0 ? session.stats.nodes * 1000 / static_cast<uint64_t>(info.time_ms) : 0;
            info.hashfull = session.tt.hashfull();
            info.pv = extractPV(board, depth, session.tt);
            if (info.pv.empty()) info.pv.push_back(best_move);
            session.on_info(info);
        }
    }

    session.stats.best_move = best_move;
    session.stats.best_score = best_score;
    session.stats.elapsed_ms = tm.elapsed_ms();
    return best_move;
}

chess::Move findBestMove(chess::Board& board, int max_depth, int64_t time_budget_ms,
                         SearchSession& session) {
    TimeManager tm;
    tm.init(time_budget_ms);
    return search(board, max_depth, session, tm);
}
