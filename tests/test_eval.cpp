#include "eval.h"
#include <gtest/gtest.h>

TEST(Evaluator, StartPositionIsBalanced) {
    chess::Board board;
    EXPECT_NEAR(Evaluator::evaluateUncached(board, chess::Color::WHITE), 0.0, 1e-9);
    EXPECT_NEAR(Evaluator::evaluateUncached(board, chess::Color::BLACK), 0.0, 1e-9);
}

TEST(Evaluator, BareKingsScoreZero) {
    chess::Board board("4k3/8/8/8/8/8/8/4K3 w - - 0 1");
    EXPECT_EQ(Evaluator::evaluateUncached(board, chess::Color::WHITE), 0.0);
}

TEST(Evaluator, PerspectiveFlipsSign) {
    chess::Board board("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    Score white = Evaluator::evaluateUncached(board, chess::Color::WHITE);
    Score black = Evaluator::evaluateUncached(board, chess::Color::BLACK);
    EXPECT_DOUBLE_EQ(white, -black);
}

TEST(Evaluator, ExtraQueenIsWorthAboutNine) {
    chess::Board board("4k3/8/8/8/8/8/8/3QK3 w - - 0 1");
    Score score = Evaluator::evaluateUncached(board, chess::Color::WHITE);
    EXPECT_GT(score, 9.0);
    EXPECT_LT(score, 11.0);
}

TEST(Evaluator, AdvancedPawnScoresHigher) {
    chess::Board far("4k3/8/4P3/8/8/8/8/4K3 w - - 0 1");
    chess::Board near("4k3/8/8/8/8/4P3/8/4K3 w - - 0 1");
    EXPECT_GT(Evaluator::evaluateUncached(far, chess::Color::WHITE),
              Evaluator::evaluateUncached(near, chess::Color::WHITE));
}

TEST(Evaluator, HangingPieceDroppedOnlyWhenOwnerCannotReact) {
    // Knight on d5 attacked by the e6 pawn with no defender
    chess::Board white_to_move("4k3/8/4p3/3N4/8/8/8/4K3 w - - 0 1");
    chess::Board black_to_move("4k3/8/4p3/3N4/8/8/8/4K3 b - - 0 1");

    Score saved = Evaluator::evaluateUncached(white_to_move, chess::Color::WHITE);
    Score lost = Evaluator::evaluateUncached(black_to_move, chess::Color::WHITE);
    EXPECT_GT(saved - lost, 2.9);
}

TEST(Evaluator, DefendedPieceIsNeverDropped) {
    chess::Board white_to_move("4k3/8/4p3/3N4/2P5/8/8/4K3 w - - 0 1");
    chess::Board black_to_move("4k3/8/4p3/3N4/2P5/8/8/4K3 b - - 0 1");

    EXPECT_DOUBLE_EQ(Evaluator::evaluateUncached(white_to_move, chess::Color::WHITE),
                     Evaluator::evaluateUncached(black_to_move, chess::Color::WHITE));
}

TEST(Evaluator, CacheHitIsBitIdentical) {
    chess::Board board("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    Evaluator eval;

    Score first = eval.evaluate(board, chess::Color::WHITE);
    Score second = eval.evaluate(board, chess::Color::WHITE);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, Evaluator::evaluateUncached(board, chess::Color::WHITE));
    EXPECT_EQ(eval.misses(), 1u);
    EXPECT_EQ(eval.hits(), 1u);
}

TEST(Evaluator, ClearEmptiesCache) {
    chess::Board board;
    Evaluator eval;
    eval.evaluate(board, chess::Color::WHITE);
    ASSERT_EQ(eval.size(), 1u);

    eval.clear();
    EXPECT_EQ(eval.size(), 0u);
    EXPECT_EQ(eval.hits(), 0u);
    EXPECT_EQ(eval.misses(), 0u);
}
