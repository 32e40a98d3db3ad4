#pragma once

#include "chess.hpp"
#include "types.h"
#include <cstdint>
#include <vector>

enum TTFlag : uint8_t { TT_EXACT = 0, TT_LOWER = 1, TT_UPPER = 2 };

struct TTEntry {
    uint64_t key = 0;
    int16_t depth = -1;
    Score score = 0.0;
    chess::Move best_move = chess::Move();
    TTFlag flag = TT_EXACT;
};

// Node results keyed by (depth remaining, fingerprint). Bounds are only valid
// for the depth they were computed at, so entries never answer for another
// depth. Last write wins.
class TranspositionTable {
public:
    explicit TranspositionTable(size_t mb = DEFAULT_HASH_MB);

    void resize(size_t mb);
    void clear();

    void store(int depth, uint64_t key, Score score, chess::Move best_move, TTFlag flag);
    bool probe(int depth, uint64_t key, TTEntry& out) const;

    size_t size() const { return table.size(); }

private:
    size_t index(int depth, uint64_t key) const;

    std::vector<TTEntry> table;
    size_t mask = 0;
};
