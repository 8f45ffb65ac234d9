#include "Search.hpp"
#include "MoveGen.hpp"
#include "Evaluation.hpp"
#include <algorithm>
#include <thread>
#include <vector>

namespace Search {

    namespace {
        // Scores are written by candidate index, so the reduction below sees them in
        // generation order no matter how the work was split.
        void score_candidates(const BoardState& board, const std::vector<Move>& moves, Colour side,
                              unsigned threads, std::vector<double>& scores) {
            scores.assign(moves.size(), 0.0);

            unsigned workers = std::min<unsigned>(threads, static_cast<unsigned>(moves.size()));
            if (workers <= 1) {
                for (size_t i = 0; i < moves.size(); ++i) {
                    scores[i] = Evaluation::evaluate_move(board, moves[i], side);
                }
                return;
            }

            std::vector<std::thread> pool;
            pool.reserve(workers);
            for (unsigned w = 0; w < workers; ++w) {
                pool.emplace_back([&board, &moves, &scores, side, w, workers]() {
                    for (size_t i = w; i < moves.size(); i += workers) {
                        scores[i] = Evaluation::evaluate_move(board, moves[i], side);
                    }
                });
            }
            for (auto& t : pool) t.join();
        }

        const Move& pick(const std::vector<Move>& from, std::mt19937_64& rng) {
            std::uniform_int_distribution<size_t> dist(0, from.size() - 1);
            return from[dist(rng)];
        }
    }

    std::optional<Move> choose_move(const BoardState& board, const SearchParams& params,
                                    std::mt19937_64& rng, SearchStats& stats) {
        stats = SearchStats();

        std::vector<Move> moves;
        MoveGen::generate_moves(board, params.side, moves);
        stats.candidates = static_cast<int>(moves.size());
        if (moves.empty()) return std::nullopt;

        std::vector<double> scores;
        score_candidates(board, moves, params.side, params.threads, scores);

        // Exact comparison: the only fractional term is 0.1 * an integer piece value
        double best_score = scores[0];
        std::vector<Move> best_moves;
        for (size_t i = 0; i < moves.size(); ++i) {
            if (scores[i] > best_score) {
                best_score = scores[i];
                best_moves.clear();
                best_moves.push_back(moves[i]);
            } else if (scores[i] == best_score) {
                best_moves.push_back(moves[i]);
            }
        }

        // Prefer taking the most valuable piece among the tied moves
        std::vector<Move> capture_best;
        int cap_best_val = 0;
        for (const auto& m : best_moves) {
            // A captured king is worth 0 but still counts as a capture
            if (!board.get(m.to())) continue;
            int val = Evaluation::capture_bonus(board, m);
            if (val > cap_best_val) {
                cap_best_val = val;
                capture_best.clear();
                capture_best.push_back(m);
            } else if (val == cap_best_val) {
                capture_best.push_back(m);
            }
        }

        stats.best_score = best_score;
        stats.tied_best = static_cast<int>(best_moves.size());
        stats.best_capture_value = cap_best_val;

        if (!capture_best.empty()) return pick(capture_best, rng);
        return pick(best_moves, rng);
    }

    std::optional<Move> choose_move(const BoardState& board, Colour side, std::mt19937_64& rng) {
        SearchParams params;
        params.side = side;
        SearchStats stats;
        return choose_move(board, params, rng, stats);
    }
}
