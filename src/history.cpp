#include "history.h"

void HintMoves::store(uint64_t key, chess::Move move) {
    if (move == chess::Move()) return;
    table[key] = move;
}

chess::Move HintMoves::get(uint64_t key) const {
    auto it = table.find(key);
    if (it == table.end()) return chess::Move();
    return it->second;
}

bool HintMoves::is_hint(uint64_t key, chess::Move move) const {
    if (move == chess::Move()) return false;
    auto it = table.find(key);
    return it != table.end() && it->second == move;
}
