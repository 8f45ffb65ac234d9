#pragma once

#include "IChessCore.hpp"
#include "Search.hpp"

#include <cstdint>
#include <random>
#include <string>


struct GameConfig {
    // Colour::None means nobody is automated
    Colour agent_side = Colour::Black;
    uint64_t seed = 5489u;
    unsigned threads = 1;
    std::string start_placement = "startpos";
};

// One game session: the authoritative board, whose turn it is and the agent.
class Game : public IChessCore {
public:
    explicit Game(const GameConfig& config = GameConfig());

    std::optional<Piece> piece_at(Square sq) const override;
    std::vector<Move> moves(Colour side) const override;
    std::vector<Move> moves_from(Square sq) const override;

    // Plays `move` for the side to move if it matches one of its generated moves.
    bool apply_move(Move move) override;

    std::optional<Move> agent_move() override;
    int material_score(Colour side) const override;
    Colour side_to_move() const override { return to_move; }
    const BoardState& get_board_state() const override { return board; }
    void reset() override;
    bool load(std::string_view placement, Colour side) override;

    bool is_agent_turn() const;

    // Agent plays for the side to move if that side is automated. When it has no
    // move the turn passes anyway and nullopt is returned.
    std::optional<Move> play_agent_turn();

    // Both sides played by the agent until one cannot move or `max_plies` is reached.
    // Returns the side left without a move, or Colour::None on the ply limit.
    Colour play_out(int max_plies);

    // Hands the move to the other side without touching the board
    void pass_turn();

    Colour agent_side() const { return config.agent_side; }
    void set_agent_side(Colour side) { config.agent_side = side; }
    int ply() const { return ply_count; }
    const Search::SearchStats& last_stats() const { return stats; }

private:
    GameConfig config;
    BoardState board;
    Colour to_move = Colour::White;
    int ply_count = 0;
    std::mt19937_64 rng;
    Search::SearchStats stats;
};
