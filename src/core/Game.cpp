#include "Game.hpp"
#include "MoveGen.hpp"

#include <algorithm>


Game::Game(const GameConfig& cfg) : config(cfg), rng(cfg.seed) {
    reset();
}

std::optional<Piece> Game::piece_at(Square sq) const {
    return board.get(sq);
}

std::vector<Move> Game::moves(Colour side) const {
    return MoveGen::generate_moves(board, side);
}

std::vector<Move> Game::moves_from(Square sq) const {
    std::vector<Move> list;
    MoveGen::generate_moves_from(board, to_move, sq, list);
    return list;
}

bool Game::apply_move(Move move) {
    std::vector<Move> legal = moves_from(move.from());
    bool found = std::any_of(legal.begin(), legal.end(), [&](const Move& m) {
        return m.same_squares(move);
    });
    if (!found) return false;

    board.apply_move(move);
    pass_turn();
    return true;
}

std::optional<Move> Game::agent_move() {
    Search::SearchParams params;
    params.side = to_move;
    params.threads = config.threads;
    return Search::choose_move(board, params, rng, stats);
}

int Game::material_score(Colour side) const {
    return board.material_score(side);
}

void Game::reset() {
    if (!board.load_placement(config.start_placement)) {
        board.reset();
    }
    to_move = Colour::White;
    ply_count = 0;
    rng.seed(config.seed);
    stats = Search::SearchStats();
}

bool Game::load(std::string_view placement, Colour side) {
    if (side == Colour::None) return false;
    if (!board.load_placement(placement)) return false;
    to_move = side;
    ply_count = 0;
    stats = Search::SearchStats();
    return true;
}

bool Game::is_agent_turn() const {
    return config.agent_side == to_move;
}

std::optional<Move> Game::play_agent_turn() {
    if (!is_agent_turn()) return std::nullopt;

    std::optional<Move> best = agent_move();
    if (best) board.apply_move(*best);
    pass_turn();
    return best;
}

Colour Game::play_out(int max_plies) {
    for (int i = 0; i < max_plies; ++i) {
        std::optional<Move> best = agent_move();
        if (!best) return to_move;
        board.apply_move(*best);
        pass_turn();
    }
    return Colour::None;
}

void Game::pass_turn() {
    to_move = opposite(to_move);
    ply_count++;
}
