#pragma once

#include "chess.hpp"
#include "types.h"
#include <cstdint>
#include <unordered_map>

// Best move last found for a position. Used only as an ordering hint and
// kept across turns; ucinewgame clears it.
struct HintMoves {
    static constexpr size_t MAX_ENTRIES = 1 << 20;

    std::unordered_map<uint64_t, chess::Move> table;

    void clear() { table.clear(); }
    void store(uint64_t key, chess::Move move);
    chess::Move get(uint64_t key) const;
    bool is_hint(uint64_t key, chess::Move move) const;
    size_t size() const { return table.size(); }

    bool should_age() const { return table.size() > MAX_ENTRIES; }
    void age() { table.clear(); }
};
