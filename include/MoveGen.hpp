#pragma once
#include "BoardState.hpp"
#include <vector>

// Pseudo-legal generation only: moves that leave the own king en prise are kept.
namespace MoveGen {
    void generate_moves(const BoardState& board, Colour side, std::vector<Move>& move_list);

    std::vector<Move> generate_moves(const BoardState& board, Colour side);

    // Moves of `side` starting on `from`; nothing for empty or enemy squares
    void generate_moves_from(const BoardState& board, Colour side, Square from, std::vector<Move>& move_list);
}
