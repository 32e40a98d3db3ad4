#pragma once

#include "chess.hpp"
#include "types.h"
#include <cstdint>
#include <random>
#include <vector>

struct MovePickerContext {
    chess::Move tt_move = chess::Move();
    chess::Move hint_move = chess::Move();

    MovePickerContext() = default;
    MovePickerContext(chess::Move tt, chess::Move hint) : tt_move(tt), hint_move(hint) {}
};

// Orders moves by cutoff likelihood. Ties are broken with seeded jitter so
// the same seed always produces the same ordering.
class MovePicker {
public:
    explicit MovePicker(uint32_t seed = DEFAULT_SEED) : rng(seed) {}

    void seed(uint32_t s) { rng.seed(s); }

    Score scoreMoveForOrdering(const chess::Board& board, const chess::Move& move,
                               const MovePickerContext& ctx);
    std::vector<ScoredMove> scoreMoves(const chess::Movelist& moves,
                                       const chess::Board& board,
                                       const MovePickerContext& ctx);

private:
    std::mt19937 rng;
    std::uniform_real_distribution<double> jitter{0.0, 1.0};
};

void pickNextMove(std::vector<ScoredMove>& moves, size_t current);
