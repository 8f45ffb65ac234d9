#pragma once
#include "Game.hpp"

namespace GUI {
    void Launch(const GameConfig& config);
}
