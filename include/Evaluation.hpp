#pragma once

#include "BoardState.hpp"
#include "Types.hpp"

#include <array>


namespace Evaluation {
    // Indexed by PieceType: Pawn, Knight, Bishop, Rook, Queen, King
    inline constexpr std::array<int, 6> MATERIAL_VALUES = {1, 3, 3, 5, 9, 0};

    inline constexpr double CAPTURE_BONUS_WEIGHT = 0.1;

    constexpr int material_value(PieceType type) {
        if (type == PieceType::None) return 0;
        return MATERIAL_VALUES[static_cast<size_t>(type)];
    }

    // Value of the piece sitting on the destination before the move is played
    int capture_bonus(const BoardState& board, const Move& move);

    // Material for `side` after playing `move` on a copy of the board, plus a small
    // bonus for the value of the captured piece.
    double evaluate_move(const BoardState& board, const Move& move, Colour side);
}
