#pragma once

#include "config.h"
#include <chrono>
#include <cstdint>

struct TimeManager {
    int64_t soft_limit_ms = 0;
    int64_t hard_limit_ms = 0;
    bool unlimited = true;
    std::chrono::steady_clock::time_point start_time;

    // budget <= 0 searches without a clock
    void init(int64_t budget);
    int64_t elapsed_ms() const;
    // Hard limit: abandon the depth in progress
    bool should_stop() const;
    // Soft limit: may another depth be started
    bool should_continue_depth() const;

    // Splits a UCI clock into one move budget
    static int64_t budget_from_clock(int time_left_ms, int inc_ms, int movestogo, int movetime_ms);

    static constexpr int MOVE_OVERHEAD_MS = 50;
    static constexpr int MIN_THINKING_TIME = 10;
};
