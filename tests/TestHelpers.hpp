#pragma once

#include "BoardState.hpp"
#include "Types.hpp"

#include <algorithm>
#include <vector>

inline void clear_board(BoardState& b) {
    b.clear();
}

inline void add_piece(BoardState& b, Square sq, PieceType type, Colour color) {
    b.set(sq, Piece(color, type));
}

inline bool contains(const std::vector<Move>& moves, const Move& m) {
    return std::find(moves.begin(), moves.end(), m) != moves.end();
}
