#pragma once

#include <vector>

#include "game/gameplay/Hero.hpp"
#include "game/maps/GridMap.hpp"

namespace game::gameplay
{
struct LabyrinthSnapshot
{
    std::vector<std::vector<int>> grid;
    std::vector<maps::GridCoord> hazards;
    maps::GridCoord keyCell{1, 2};
    bool keyPresent = true;
    maps::GridCoord golemCell{0, 7};

    bool operator==(const LabyrinthSnapshot& other) const = default;
};

struct SessionSnapshot
{
    int round = 0;
    int turnIndex = 0;
    std::vector<maps::GridCoord> hazards;
    std::vector<HeroState> heroes;
    LabyrinthSnapshot labyrinth;

    bool operator==(const SessionSnapshot& other) const = default;
};
} // namespace game::gameplay
