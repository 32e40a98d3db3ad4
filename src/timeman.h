#pragma once

#include <chrono>
#include <cstdint>

struct TimeManager {
    int time_left_ms = 0;
    int movetime_ms = 0;
    int deadline_ms = 0;
    int panic_reserve_ms = PANIC_RESERVE_MS;
    std::chrono::steady_clock::time_point start_time;

    static constexpr int PANIC_RESERVE_MS = 2000;
    static constexpr int MIN_DEADLINE_MS = 25;
    static constexpr int MAX_DEADLINE_MS = 2000;
    static constexpr int MIN_THINK_MS = 100;
    static constexpr int MOVE_OVERHEAD_MS = 10;
    static constexpr int NO_DEADLINE_MS = 999999999;

    // Starts the clock for this turn. time_ms <= 0 and fixed_movetime <= 0
    // means no clock at all.
    void init(int time_ms, int fixed_movetime = 0);
    void init_fixed_deadline(int ms);

    int64_t elapsed_ms() const;
    bool should_stop() const;
    bool min_think_elapsed() const;

    static int turn_deadline(int remaining_ms, int panic_reserve_ms = PANIC_RESERVE_MS);
};
