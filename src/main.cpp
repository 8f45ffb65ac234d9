#include "Interface.hpp"
#include "Game.hpp"
#include <iostream>
#include <string>
#include <cstdint>
#include <stdexcept>

namespace {
    Colour agent_for(int human_side) {
        if (human_side == 0) return Colour::Black;
        if (human_side == 1) return Colour::White;
        return Colour::None;
    }
}

extern "C" {
    #ifdef _WIN32
    __declspec(dllexport)
    #endif

    // human_side: 0 = White, 1 = Black, 2 = both sides human
    void startEngine(int human_side, uint64_t seed, const char* placement) {
        GameConfig config;
        config.agent_side = agent_for(human_side);
        config.seed = seed;
        config.start_placement = (placement != nullptr) ? std::string(placement) : "startpos";

        GUI::Launch(config);
    }

    // Agent against itself: returns 0 = ply limit reached, 1 = White left without a
    // move, 2 = Black left without a move, -1 = bad placement
    #ifdef _WIN32
    __declspec(dllexport)
    #endif
    int runHeadlessGame(uint64_t seed, const char* placement, int max_plies) {
        GameConfig config;
        config.agent_side = Colour::None;
        config.seed = seed;

        Game game(config);
        if (placement != nullptr && !game.load(placement, Colour::White)) return -1;

        Colour stuck = game.play_out(max_plies);
        if (stuck == Colour::White) return 1;
        if (stuck == Colour::Black) return 2;
        return 0;
    }
}

#ifndef BUILD_AS_LIBRARY
int main(int argc, char** argv) {
    int human_side = 0;
    uint64_t seed = 5489u;
    std::string placement = "startpos";

    try {
        if (argc > 1) human_side = std::stoi(argv[1]);
        if (argc > 2) seed = std::stoull(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "usage: minichess [human_side 0|1|2] [seed] [placement]" << std::endl;
        return 1;
    }
    if (argc > 3) placement = argv[3];

    std::cout << "Starting Mini Chess (Human vs Agent)" << std::endl;
    startEngine(human_side, seed, placement.c_str());
    return 0;
}
#endif
