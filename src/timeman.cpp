#include "timeman.h"
#include <algorithm>

void TimeManager::init(int64_t budget) {
    start_time = std::chrono::steady_clock::now();
    unlimited = budget <= 0;

    if (unlimited) {
        soft_limit_ms = hard_limit_ms = INT64_MAX;
        return;
    }
    soft_limit_ms = static_cast<int64_t>(static_cast<double>(budget) * SOFT_TIME_FRACTION);
    hard_limit_ms = static_cast<int64_t>(static_cast<double>(budget) * HARD_TIME_FRACTION);
}

int64_t TimeManager::elapsed_ms() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
}

bool TimeManager::should_stop() const {
    return !unlimited && elapsed_ms() >= hard_limit_ms;
}

bool TimeManager::should_continue_depth() const {
    return unlimited || elapsed_ms() < soft_limit_ms;
}

int64_t TimeManager::budget_from_clock(int time_left_ms, int inc_ms, int movestogo, int movetime_ms) {
    if (movetime_ms > 0)
        return std::max<int64_t>(MIN_THINKING_TIME, movetime_ms - MOVE_OVERHEAD_MS);
    if (time_left_ms <= 0)
        return 0;

    int64_t base_time = (time_left_ms / 20) + (inc_ms / 2);
    if (movestogo > 0 && movestogo <= 10)
        base_time = std::min<int64_t>(base_time, time_left_ms / (movestogo + 2));
    base_time = std::min<int64_t>(base_time, time_left_ms - MOVE_OVERHEAD_MS);
    return std::max<int64_t>(MIN_THINKING_TIME, base_time);
}
