#pragma once

#include <cstdint>
#include <cstddef>

using u64 = uint64_t;
using usize = size_t;

// Scores
constexpr int MATE_SCORE = 30000;
constexpr int MATE_BOUND = MATE_SCORE - 1000;   // |score| above this is a mate
constexpr int INF_SCORE  = MATE_SCORE + 1;
constexpr int DRAW_SCORE = 0;

// Limits
constexpr int MAX_PLY = 128;
constexpr usize DEFAULT_HASH_MB = 64;
constexpr usize MAX_HASH_MB = 4096;

// Used by `go` without any limit
constexpr int DEFAULT_SEARCH_DEPTH = 4;
constexpr int DEFAULT_MOVE_TIME_MS = 3000;

// Time management: start no new depth past SOFT, abort a depth past HARD
constexpr double SOFT_TIME_FRACTION = 0.80;
constexpr double HARD_TIME_FRACTION = 0.90;
constexpr u64 TIME_CHECK_INTERVAL = 1024;  // nodes between clock polls, power of two

// Evaluation
constexpr int MOBILITY_WEIGHT = 5;
constexpr int ENDGAME_MAX_QUEENS = 1;
constexpr int ENDGAME_MAX_ROOKS  = 2;
constexpr int ENDGAME_MAX_MINORS = 1;

// Move ordering tiers and bonuses
constexpr int ORDER_HINT_BONUS   = 1'000'000;
constexpr int ORDER_KILLER_BONUS =   900'000;
constexpr int ORDER_UNDEFENDED_CAPTURE = 50;
constexpr int ORDER_CHECK_BONUS  = 30;
constexpr int ORDER_CENTER_PAWN  = 10;
constexpr int ORDER_PASSED_PAWN_PER_RANK = 2;
constexpr int ORDER_HISTORY_DIVISOR = 16;
constexpr int ORDER_HISTORY_MAX_BONUS = 40;   // stays below any capture score

// History
constexpr int HISTORY_MAX = 1 << 20;
