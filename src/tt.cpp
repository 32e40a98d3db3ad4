#include "tt.h"
#include <algorithm>
#include <iostream>

TranspositionTable::TranspositionTable(size_t mb) {
    resize(mb);
}

void TranspositionTable::resize(size_t mb) {
    size_t bytes = std::max<size_t>(mb, 1) * 1024 * 1024;
    size_t entries = bytes / sizeof(TTEntry);
    size_t power = 1;
    while (power * 2 <= entries) power *= 2;
    table.assign(power, TTEntry());
    mask = power - 1;
    std::cout << "info string Hash table initialized: " << mb << " MB ("
              << power << " entries)" << std::endl;
}

void TranspositionTable::clear() {
    std::fill(table.begin(), table.end(), TTEntry());
}

size_t TranspositionTable::index(int depth, uint64_t key) const {
    uint64_t mixed = key ^ (static_cast<uint64_t>(depth) * 0x9E3779B97F4A7C15ULL);
    return static_cast<size_t>(mixed & mask);
}

void TranspositionTable::store(int depth, uint64_t key, Score score, chess::Move best_move,
                               TTFlag flag) {
    TTEntry& entry = table[index(depth, key)];
    entry.key = key;
    entry.depth = static_cast<int16_t>(depth);
    entry.score = score;
    entry.best_move = best_move;
    entry.flag = flag;
}

bool TranspositionTable::probe(int depth, uint64_t key, TTEntry& out) const {
    const TTEntry& entry = table[index(depth, key)];
    if (entry.key != key || entry.depth != depth) return false;
    out = entry;
    return true;
}
