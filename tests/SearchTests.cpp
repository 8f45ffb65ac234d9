#include <gtest/gtest.h>
#include "BoardState.hpp"
#include "MoveGen.hpp"
#include "Search.hpp"
#include "TestHelpers.hpp"

#include <random>
#include <set>
#include <utility>

TEST(SearchTest, NoMovesReturnsNothing) {
    BoardState board;
    clear_board(board);
    std::mt19937_64 rng(1);
    EXPECT_FALSE(Search::choose_move(board, Colour::White, rng).has_value());

    // Blocked pawn is the only piece
    add_piece(board, Square(4, 4), PieceType::Pawn, Colour::White);
    add_piece(board, Square(3, 4), PieceType::Pawn, Colour::Black);
    EXPECT_FALSE(Search::choose_move(board, Colour::White, rng).has_value());
}

TEST(SearchTest, SingleMoveIsAlwaysChosen) {
    BoardState board;
    clear_board(board);
    add_piece(board, Square(4, 4), PieceType::Pawn, Colour::White);
    add_piece(board, Square(0, 7), PieceType::King, Colour::Black);

    for (uint64_t seed = 0; seed < 16; ++seed) {
        std::mt19937_64 rng(seed);
        std::optional<Move> best = Search::choose_move(board, Colour::White, rng);
        ASSERT_TRUE(best.has_value());
        EXPECT_EQ(*best, Move(Square(4, 4), Square(3, 4)));
    }
}

TEST(SearchTest, ChosenMoveIsGenerated) {
    BoardState board;
    board.apply_move(Move(Square(6, 4), Square(4, 4)));
    board.apply_move(Move(Square(1, 3), Square(3, 3)));

    for (Colour side : {Colour::White, Colour::Black}) {
        std::vector<Move> moves = MoveGen::generate_moves(board, side);
        for (uint64_t seed = 0; seed < 32; ++seed) {
            std::mt19937_64 rng(seed);
            std::optional<Move> best = Search::choose_move(board, side, rng);
            ASSERT_TRUE(best.has_value());
            EXPECT_TRUE(contains(moves, *best));
        }
    }
}

TEST(SearchTest, TakesTheQueen) {
    BoardState board;
    clear_board(board);
    add_piece(board, Square(7, 0), PieceType::Rook, Colour::White);
    add_piece(board, Square(0, 0), PieceType::Queen, Colour::Black);
    add_piece(board, Square(7, 5), PieceType::Knight, Colour::Black);

    Search::SearchParams params;
    params.side = Colour::White;
    Search::SearchStats stats;
    std::mt19937_64 rng(7);

    std::optional<Move> best = Search::choose_move(board, params, rng, stats);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, Move(Square(7, 0), Square(0, 0)));
    EXPECT_DOUBLE_EQ(stats.best_score, 2.9);
    EXPECT_EQ(stats.tied_best, 1);
    EXPECT_EQ(stats.best_capture_value, 9);
}

TEST(SearchTest, PrefersPromotion) {
    BoardState board;
    clear_board(board);
    add_piece(board, Square(1, 0), PieceType::Pawn, Colour::White);
    add_piece(board, Square(7, 7), PieceType::King, Colour::White);
    add_piece(board, Square(4, 4), PieceType::King, Colour::Black);

    std::mt19937_64 rng(3);
    std::optional<Move> best = Search::choose_move(board, Colour::White, rng);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, Move(Square(1, 0), Square(0, 0)));
}

// Capturing a king scores the same as a quiet move, but still wins the tie-break
TEST(SearchTest, TieBreakPrefersCapture) {
    BoardState board;
    clear_board(board);
    add_piece(board, Square(7, 0), PieceType::Rook, Colour::White);
    add_piece(board, Square(0, 0), PieceType::King, Colour::Black);

    for (uint64_t seed = 0; seed < 16; ++seed) {
        Search::SearchParams params;
        params.side = Colour::White;
        Search::SearchStats stats;
        std::mt19937_64 rng(seed);

        std::optional<Move> best = Search::choose_move(board, params, rng, stats);
        ASSERT_TRUE(best.has_value());
        EXPECT_EQ(*best, Move(Square(7, 0), Square(0, 0)));
        EXPECT_EQ(stats.candidates, 14);
        EXPECT_EQ(stats.tied_best, 14);
    }
}

TEST(SearchTest, EqualCapturesAreDrawnAtRandom) {
    BoardState board;
    clear_board(board);
    add_piece(board, Square(4, 4), PieceType::Pawn, Colour::White);
    add_piece(board, Square(3, 3), PieceType::Knight, Colour::Black);
    add_piece(board, Square(3, 5), PieceType::Knight, Colour::Black);

    const Move left(Square(4, 4), Square(3, 3));
    const Move right(Square(4, 4), Square(3, 5));

    std::set<std::pair<int, int>> seen;
    for (uint64_t seed = 0; seed < 64; ++seed) {
        std::mt19937_64 rng(seed);
        std::optional<Move> best = Search::choose_move(board, Colour::White, rng);
        ASSERT_TRUE(best.has_value());
        ASSERT_TRUE(*best == left || *best == right);
        seen.insert({best->to().rank, best->to().file});
    }
    EXPECT_EQ(seen.size(), 2u);
}

TEST(SearchTest, QuietTiesUseWholeSet) {
    BoardState board;
    Search::SearchParams params;
    params.side = Colour::White;
    Search::SearchStats stats;

    std::set<std::pair<int, int>> origins;
    for (uint64_t seed = 0; seed < 64; ++seed) {
        std::mt19937_64 rng(seed);
        std::optional<Move> best = Search::choose_move(board, params, rng, stats);
        ASSERT_TRUE(best.has_value());
        origins.insert({best->from().rank, best->from().file});
    }
    EXPECT_EQ(stats.candidates, 20);
    EXPECT_EQ(stats.tied_best, 20);
    EXPECT_DOUBLE_EQ(stats.best_score, 0.0);
    EXPECT_EQ(stats.best_capture_value, 0);
    EXPECT_GT(origins.size(), 1u);
}

TEST(SearchTest, SameSeedSameMove) {
    BoardState board;
    for (uint64_t seed = 0; seed < 8; ++seed) {
        std::mt19937_64 a(seed);
        std::mt19937_64 b(seed);
        EXPECT_EQ(Search::choose_move(board, Colour::Black, a), Search::choose_move(board, Colour::Black, b));
    }
}

TEST(SearchTest, ParallelMatchesSequential) {
    BoardState board;
    ASSERT_TRUE(board.load_placement("r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R"));

    for (Colour side : {Colour::White, Colour::Black}) {
        for (uint64_t seed = 0; seed < 8; ++seed) {
            Search::SearchParams seq;
            seq.side = side;
            seq.threads = 1;
            Search::SearchParams par = seq;
            par.threads = 4;

            Search::SearchStats seq_stats;
            Search::SearchStats par_stats;
            std::mt19937_64 rng_a(seed);
            std::mt19937_64 rng_b(seed);

            std::optional<Move> a = Search::choose_move(board, seq, rng_a, seq_stats);
            std::optional<Move> b = Search::choose_move(board, par, rng_b, par_stats);

            ASSERT_TRUE(a.has_value());
            EXPECT_EQ(a, b);
            EXPECT_EQ(seq_stats.candidates, par_stats.candidates);
            EXPECT_EQ(seq_stats.tied_best, par_stats.tied_best);
            EXPECT_DOUBLE_EQ(seq_stats.best_score, par_stats.best_score);
        }
    }
}

TEST(SearchTest, BoardUntouchedBySearch) {
    BoardState board;
    board.apply_move(Move(Square(6, 3), Square(4, 3)));
    board.apply_move(Move(Square(1, 4), Square(3, 4)));
    BoardState before = board;

    std::mt19937_64 rng(11);
    Search::choose_move(board, Colour::White, rng);
    EXPECT_EQ(board, before);
}
