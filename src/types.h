#pragma once

#include "config.h"
#include "chess.hpp"

// Utility functions
inline chess::Color oppColor(chess::Color c) {
    return c == chess::Color::WHITE ? chess::Color::BLACK : chess::Color::WHITE;
}

// Material in pawn units. The king never counts as material.
inline Score pieceValue(chess::PieceType pt) {
    static const Score values[] = {1.0, 3.0, 3.0, 5.0, 9.0, 0.0};
    int idx = static_cast<int>(pt);
    return (idx >= 0 && idx < 6) ? values[idx] : 0.0;
}

inline uint64_t fingerprint(const chess::Board& board) {
    return board.zobrist();
}

// Castling is encoded king-takes-own-rook, so it never counts as a capture.
inline chess::Piece capturedPiece(const chess::Board& board, const chess::Move& move) {
    if (move.typeOf() == chess::Move::CASTLING) return chess::Piece::NONE;
    if (move.typeOf() == chess::Move::ENPASSANT) {
        return board.at(chess::Square(move.to().file(), move.from().rank()));
    }
    return board.at(move.to());
}

inline bool isCapture(const chess::Board& board, const chess::Move& move) {
    return capturedPiece(board, move) != chess::Piece::NONE;
}

inline bool isQuietMove(const chess::Board& board, const chess::Move& move) {
    return !isCapture(board, move) && move.typeOf() != chess::Move::PROMOTION;
}

struct ScoredMove {
    chess::Move move = chess::Move();
    Score score = 0.0;

    ScoredMove() = default;
    ScoredMove(const chess::Move& m, Score s) : move(m), score(s) {}
};

struct SearchStats {
    uint64_t nodes = 0;
    void reset() { nodes = 0; }
};

// Outcome of one search node. An aborted result carries no usable move or score.
struct SearchResult {
    chess::Move move = chess::Move();
    Score score = 0.0;
    bool aborted = false;

    SearchResult() = default;
    SearchResult(const chess::Move& m, Score s) : move(m), score(s) {}

    static SearchResult abort() {
        SearchResult r;
        r.aborted = true;
        return r;
    }
};
