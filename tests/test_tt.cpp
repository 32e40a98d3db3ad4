#include "tt.h"
#include <gtest/gtest.h>

TEST(TranspositionTable, StoreThenProbeSameDepth) {
    TranspositionTable tt(1);
    chess::Board board;
    chess::Move move = chess::uci::uciToMove(board, "e2e4");
    uint64_t key = fingerprint(board);

    tt.store(3, key, 1.25, move, TT_LOWER);

    TTEntry entry;
    ASSERT_TRUE(tt.probe(3, key, entry));
    EXPECT_EQ(entry.best_move, move);
    EXPECT_DOUBLE_EQ(entry.score, 1.25);
    EXPECT_EQ(entry.flag, TT_LOWER);
}

TEST(TranspositionTable, EntriesOnlyAnswerForTheirDepth) {
    TranspositionTable tt(1);
    chess::Board board;
    uint64_t key = fingerprint(board);

    tt.store(2, key, 0.5, chess::Move(), TT_EXACT);

    TTEntry entry;
    EXPECT_FALSE(tt.probe(3, key, entry));
    EXPECT_FALSE(tt.probe(1, key, entry));
    EXPECT_TRUE(tt.probe(2, key, entry));
}

TEST(TranspositionTable, LastWriteWins) {
    TranspositionTable tt(1);
    chess::Board board;
    uint64_t key = fingerprint(board);
    chess::Move first = chess::uci::uciToMove(board, "e2e4");
    chess::Move second = chess::uci::uciToMove(board, "d2d4");

    tt.store(4, key, 3.0, first, TT_EXACT);
    tt.store(4, key, -1.0, second, TT_UPPER);

    TTEntry entry;
    ASSERT_TRUE(tt.probe(4, key, entry));
    EXPECT_EQ(entry.best_move, second);
    EXPECT_DOUBLE_EQ(entry.score, -1.0);
    EXPECT_EQ(entry.flag, TT_UPPER);
}

TEST(TranspositionTable, ClearForgetsEverything) {
    TranspositionTable tt(1);
    chess::Board board;
    uint64_t key = fingerprint(board);

    tt.store(1, key, 0.0, chess::Move(), TT_EXACT);
    tt.clear();

    TTEntry entry;
    EXPECT_FALSE(tt.probe(1, key, entry));
}

TEST(TranspositionTable, SizeIsPowerOfTwo) {
    TranspositionTable tt(2);
    size_t n = tt.size();
    EXPECT_GT(n, 0u);
    EXPECT_EQ(n & (n - 1), 0u);
}
