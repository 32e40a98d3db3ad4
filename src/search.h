#pragma once

#include "chess.hpp"
#include "types.h"
#include "timeman.h"
#include "tt.h"
#include "eval.h"
#include "history.h"
#include "movepick.h"
#include <vector>

// Makes a move for the lifetime of the guard, so every exit path unmakes it.
class ScopedMove {
public:
    ScopedMove(chess::Board& b, const chess::Move& m) : board(b), move(m) {
        board.makeMove(move);
    }
    ~ScopedMove() { board.unmakeMove(move); }

    ScopedMove(const ScopedMove&) = delete;
    ScopedMove& operator=(const ScopedMove&) = delete;

private:
    chess::Board& board;
    chess::Move move;
};

struct SearchInfo {
    chess::Move best_move = chess::Move();
    Score score = 0.0;
    int depth = 0;      // last fully completed depth, 0 if none
    uint64_t nodes = 0;
};

class Engine {
public:
    explicit Engine(size_t hash_mb = DEFAULT_HASH_MB, uint32_t seed = DEFAULT_SEED);

    // Never lets a deadline abort escape. Throws std::invalid_argument when
    // the position has no legal moves.
    chess::Move choose_move(chess::Board& board, TimeManager& tm,
                            int max_depth = DEFAULT_MAX_DEPTH);
    SearchInfo think(chess::Board& board, TimeManager& tm, int max_depth = DEFAULT_MAX_DEPTH);

    // Starts a turn: fixes the root color and empties the evaluation cache.
    void begin_turn(chess::Color root, const TimeManager* tm);

    // One iterative deepening pass at the given depth, on a fresh table.
    SearchResult search_iteration(chess::Board& board, int depth);

    SearchResult search(chess::Board& board, int depth_limit, int ply = 0,
                        Score lower_bound = -SCORE_INFINITE,
                        Score upper_bound = SCORE_INFINITE,
                        chess::Move last_move = chess::Move());

    std::vector<chess::Move> extractPV(chess::Board board, int max_depth) const;

    void new_game();
    void set_hash(size_t mb) { tt.resize(mb); }
    void set_seed(uint32_t seed) { picker.seed(seed); }
    void set_verbose(bool v) { verbose = v; }

    Evaluator& evaluator() { return eval; }
    const HintMoves& hint_moves() const { return hints; }
    const SearchStats& stats() const { return search_stats; }
    const TranspositionTable& table() const { return tt; }

private:
    bool isRuleDraw(const chess::Board& board) const;
    Score mateScore(int depth_limit, int ply, bool root_side_mated) const;
    void printInfo(chess::Board& board, const SearchResult& result, int depth,
                   const TimeManager& tm) const;

    TranspositionTable tt;
    Evaluator eval;
    HintMoves hints;
    MovePicker picker;
    SearchStats search_stats;

    const TimeManager* tm = nullptr;
    chess::Color root_color = chess::Color::WHITE;
    int root_depth = 1;
    bool verbose = true;
};
