#pragma once

#include <cstdint>
#include <cstddef>

// Scores are in pawn units from the root side's point of view
using Score = double;

// Mate scoring
constexpr Score MATE_VALUE     = 1000.0;
constexpr Score MATE_THRESHOLD = MATE_VALUE;
constexpr Score SCORE_INFINITE = 1e12;

// Evaluation weights
constexpr Score PAWN_ADVANCE_BONUS = 0.02;
constexpr Score KING_TROPISM_BONUS = 0.01;
constexpr Score MOBILITY_DIVISOR   = 500.0;

// Move ordering weights
constexpr Score ORDER_CAPTURE_WEIGHT = 10000.0;
constexpr Score ORDER_MOVER_WEIGHT   = 10.0;
constexpr Score ORDER_TT_MOVE        = 1e9;
constexpr Score ORDER_HINT_MOVE      = 1e8;

// Search shape
constexpr int ABORT_MIN_PLY           = 2;
constexpr uint64_t ABORT_POLL_MASK    = 255;
constexpr int QUIET_REDUCTION_DIVISOR = 3;

// Iterative deepening stop conditions
constexpr int DEFAULT_MAX_DEPTH      = 64;
constexpr int MATE_STABLE_ITERATIONS = 2;
constexpr int STABLE_ITERATIONS      = 3;
constexpr int MIN_STABLE_DEPTH       = 4;

// Default sizes and seeds
constexpr size_t DEFAULT_HASH_MB   = 16;
constexpr uint32_t DEFAULT_SEED  = 0;
