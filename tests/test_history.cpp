#include "history.h"
#include <gtest/gtest.h>

TEST(HintMoves, StoreAndGet) {
    HintMoves hints;
    chess::Board board;
    chess::Move move = chess::uci::uciToMove(board, "g1f3");
    uint64_t key = fingerprint(board);

    EXPECT_EQ(hints.get(key), chess::Move());
    hints.store(key, move);
    EXPECT_EQ(hints.get(key), move);
    EXPECT_TRUE(hints.is_hint(key, move));
    EXPECT_FALSE(hints.is_hint(key, chess::uci::uciToMove(board, "e2e4")));
}

TEST(HintMoves, IgnoresNoMove) {
    HintMoves hints;
    hints.store(42, chess::Move());
    EXPECT_EQ(hints.size(), 0u);
    EXPECT_FALSE(hints.is_hint(42, chess::Move()));
}

TEST(HintMoves, AgeClearsTable) {
    HintMoves hints;
    chess::Board board;
    hints.store(fingerprint(board), chess::uci::uciToMove(board, "e2e4"));
    EXPECT_FALSE(hints.should_age());
    hints.age();
    EXPECT_EQ(hints.size(), 0u);
}
