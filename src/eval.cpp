#include "eval.h"
#include <cstdlib>

namespace {

chess::Bitboard pieceAttacks(chess::PieceType pt, chess::Color color, chess::Square sq,
                             chess::Bitboard occ) {
    switch (static_cast<int>(pt)) {
        case static_cast<int>(chess::PieceType::PAWN):   return chess::attacks::pawn(color, sq);
        case static_cast<int>(chess::PieceType::KNIGHT): return chess::attacks::knight(sq);
        case static_cast<int>(chess::PieceType::BISHOP): return chess::attacks::bishop(sq, occ);
        case static_cast<int>(chess::PieceType::ROOK):   return chess::attacks::rook(sq, occ);
        case static_cast<int>(chess::PieceType::QUEEN):  return chess::attacks::queen(sq, occ);
        default: return chess::Bitboard(0ULL);
    }
}

Score positionalMultiplier(chess::PieceType pt, chess::Color color, chess::Square sq,
                           chess::Square enemy_king) {
    int file = static_cast<int>(sq.file());
    int rank = static_cast<int>(sq.rank());

    if (pt == chess::PieceType::PAWN) {
        int advanced = color == chess::Color::WHITE ? rank - 1 : 6 - rank;
        return 1.0 + PAWN_ADVANCE_BONUS * advanced;
    }

    int distance = std::abs(file - static_cast<int>(enemy_king.file())) +
                   std::abs(rank - static_cast<int>(enemy_king.rank()));
    return 1.0 + KING_TROPISM_BONUS * (14 - distance);
}

}  // namespace

Score Evaluator::evaluateUncached(const chess::Board& board, chess::Color perspective) {
    static const chess::PieceType types[] = {
        chess::PieceType::PAWN, chess::PieceType::KNIGHT, chess::PieceType::BISHOP,
        chess::PieceType::ROOK, chess::PieceType::QUEEN
    };

    const chess::Bitboard occ = board.occ();
    const chess::Color to_move = board.sideToMove();
    Score evaluation = 0.0;

    for (chess::Color color : {chess::Color::WHITE, chess::Color::BLACK}) {
        const chess::Color enemy = oppColor(color);
        const chess::Square enemy_king = board.kingSq(enemy);
        const Score sign = color == perspective ? 1.0 : -1.0;

        for (chess::PieceType pt : types) {
            chess::Bitboard bb = board.pieces(pt, color);
            while (bb) {
                chess::Square sq(bb.pop());

                // Hanging piece on the side that has no time left to save it
                if (color != to_move && board.isAttacked(sq, enemy) &&
                    !board.isAttacked(sq, color)) {
                    continue;
                }

                Score material = pieceValue(pt) * positionalMultiplier(pt, color, sq, enemy_king);
                Score mobility = pieceAttacks(pt, color, sq, occ).count() / MOBILITY_DIVISOR;
                evaluation += sign * (material + mobility);
            }
        }
    }

    return evaluation;
}

Score Evaluator::evaluate(const chess::Board& board, chess::Color perspective) {
    const uint64_t key = fingerprint(board);
    auto it = cache.find(key);
    if (it != cache.end()) {
        ++cache_hits;
        return it->second;
    }

    ++cache_misses;
    Score score = evaluateUncached(board, perspective);
    cache.emplace(key, score);
    return score;
}

void Evaluator::clear() {
    cache.clear();
    cache_hits = 0;
    cache_misses = 0;
}
