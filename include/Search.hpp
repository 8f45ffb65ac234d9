#pragma once

#include "BoardState.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace Search {

    struct SearchParams {
        Colour side = Colour::Black;
        // Candidate evaluation workers, 0 or 1 runs on the calling thread
        unsigned threads = 1;
    };

    struct SearchStats {
        int candidates = 0;
        double best_score = 0.0;
        int tied_best = 0;
        int best_capture_value = 0;
    };

    // One-ply greedy search. Returns nullopt when `params.side` has no move.
    // Ties are broken towards the most valuable capture, then at random from `rng`.
    std::optional<Move> choose_move(const BoardState& board, const SearchParams& params,
                                    std::mt19937_64& rng, SearchStats& stats);

    std::optional<Move> choose_move(const BoardState& board, Colour side, std::mt19937_64& rng);
}
