#include "Evaluation.hpp"


namespace Evaluation {

    int capture_bonus(const BoardState& board, const Move& move) {
        std::optional<Piece> victim = board.get(move.to());
        return victim ? material_value(victim->type) : 0;
    }

    double evaluate_move(const BoardState& board, const Move& move, Colour side) {
        int bonus = capture_bonus(board, move);

        BoardState sim = board.clone();
        sim.apply_move(move);

        return sim.material_score(side) + (CAPTURE_BONUS_WEIGHT * bonus);
    }
}
