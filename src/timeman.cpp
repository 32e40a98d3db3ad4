#include "timeman.h"
#include <algorithm>

int TimeManager::turn_deadline(int remaining_ms, int panic_reserve_ms) {
    return std::min(std::max(remaining_ms - panic_reserve_ms, MIN_DEADLINE_MS), MAX_DEADLINE_MS);
}

void TimeManager::init(int time_ms, int fixed_movetime) {
    time_left_ms = time_ms;
    movetime_ms = fixed_movetime;
    start_time = std::chrono::steady_clock::now();

    if (movetime_ms > 0) {
        deadline_ms = std::max(1, movetime_ms - MOVE_OVERHEAD_MS);
    } else if (time_left_ms > 0) {
        deadline_ms = turn_deadline(time_left_ms, panic_reserve_ms);
    } else {
        deadline_ms = NO_DEADLINE_MS;
    }
}

void TimeManager::init_fixed_deadline(int ms) {
    time_left_ms = 0;
    movetime_ms = ms;
    deadline_ms = ms;
    start_time = std::chrono::steady_clock::now();
}

int64_t TimeManager::elapsed_ms() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
}

bool TimeManager::should_stop() const {
    return elapsed_ms() >= deadline_ms;
}

bool TimeManager::min_think_elapsed() const {
    return elapsed_ms() >= MIN_THINK_MS;
}
