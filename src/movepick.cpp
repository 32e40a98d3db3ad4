#include "movepick.h"
#include <algorithm>

Score MovePicker::scoreMoveForOrdering(const chess::Board& board, const chess::Move& move,
                                       const MovePickerContext& ctx) {
    if (move == ctx.tt_move && ctx.tt_move != chess::Move())
        return ORDER_TT_MOVE;

    if (move == ctx.hint_move && ctx.hint_move != chess::Move())
        return ORDER_HINT_MOVE;

    chess::Piece captured = capturedPiece(board, move);
    Score victimValue = captured != chess::Piece::NONE ? pieceValue(captured.type()) : 0.0;

    // pieceValue() is zero for the king, which keeps king walks at the back
    Score moverValue = pieceValue(board.at(move.from()).type());

    return ORDER_CAPTURE_WEIGHT * victimValue + ORDER_MOVER_WEIGHT * moverValue + jitter(rng);
}

std::vector<ScoredMove> MovePicker::scoreMoves(const chess::Movelist& moves,
                                               const chess::Board& board,
                                               const MovePickerContext& ctx) {
    std::vector<ScoredMove> scored;
    scored.reserve(moves.size());
    for (const auto& move : moves)
        scored.emplace_back(move, scoreMoveForOrdering(board, move, ctx));
    return scored;
}

void pickNextMove(std::vector<ScoredMove>& moves, size_t current) {
    if (current >= moves.size()) return;
    size_t best_idx = current;
    Score best_score = moves[current].score;
    for (size_t i = current + 1; i < moves.size(); ++i) {
        if (moves[i].score > best_score) {
            best_score = moves[i].score;
            best_idx = i;
        }
    }
    if (best_idx != current)
        std::swap(moves[current], moves[best_idx]);
}
