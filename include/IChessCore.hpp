#pragma once

#include "Types.hpp"
#include "BoardState.hpp"

#include <optional>
#include <vector>
#include <string_view>


// What a front end needs from the engine: read the board, list moves,
// play a human move and ask the built-in agent for its move.
class IChessCore {
public:
    virtual ~IChessCore() = default;
    virtual std::optional<Piece> piece_at(Square sq) const = 0;
    virtual std::vector<Move> moves(Colour side) const = 0;
    virtual std::vector<Move> moves_from(Square sq) const = 0;
    virtual bool apply_move(Move move) = 0;
    virtual std::optional<Move> agent_move() = 0;
    virtual int material_score(Colour side) const = 0;
    virtual Colour side_to_move() const = 0;
    virtual const BoardState& get_board_state() const = 0;
    virtual void reset() = 0;
    virtual bool load(std::string_view placement, Colour to_move) = 0;
};
