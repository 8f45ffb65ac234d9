#include "Game.hpp"
#include "BoardState.hpp"

#include <iostream>
#include <string>
#include <cstdint>
#include <stdexcept>


// Agent plays both sides without a window and prints the final position.
int main(int argc, char** argv) {
    uint64_t seed = 5489u;
    int max_plies = 200;
    std::string placement = "startpos";

    try {
        if (argc > 1) seed = std::stoull(argv[1]);
        if (argc > 2) max_plies = std::stoi(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "usage: minichess_headless [seed] [max_plies] [placement]" << std::endl;
        return 1;
    }
    if (argc > 3) placement = argv[3];

    GameConfig config;
    config.agent_side = Colour::None;
    config.seed = seed;

    Game game(config);
    if (!game.load(placement, Colour::White)) {
        std::cerr << "Invalid placement: " << placement << std::endl;
        return 1;
    }

    std::cout << "--- ENGINE STARTED --- seed " << seed << ", " << max_plies << " plies max" << std::endl;

    Colour stuck = game.play_out(max_plies);

    std::cout << game.get_board_state().to_string();
    std::cout << "Plies: " << game.ply()
              << " | Material (White): " << game.material_score(Colour::White) << std::endl;

    if (stuck == Colour::None) {
        std::cout << "Ply limit reached" << std::endl;
    } else {
        std::cout << (stuck == Colour::White ? "White" : "Black") << " has no move" << std::endl;
    }
    return 0;
}
