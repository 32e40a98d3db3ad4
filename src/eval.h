#pragma once

#include "chess.hpp"
#include "types.h"
#include <cstdint>
#include <unordered_map>

// Static evaluation memoized by fingerprint. The cache is only valid for a
// single perspective, so it must be cleared whenever the engine starts
// thinking for a new move.
class Evaluator {
public:
    Score evaluate(const chess::Board& board, chess::Color perspective);
    static Score evaluateUncached(const chess::Board& board, chess::Color perspective);

    void clear();

    uint64_t hits() const { return cache_hits; }
    uint64_t misses() const { return cache_misses; }
    size_t size() const { return cache.size(); }

private:
    std::unordered_map<uint64_t, Score> cache;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
};
