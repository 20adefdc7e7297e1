#pragma once

#include <random>
#include <vector>

#include "game/maps/GridMap.hpp"

namespace game::maps
{
class HazardGenerator
{
public:
    static constexpr int kHazardsPerRound = 4;

    HazardGenerator();
    explicit HazardGenerator(unsigned int seed);

    /// Returns kHazardsPerRound distinct floor (code 1) cells, drawn uniformly.
    /// Throws std::logic_error when the grid has fewer floor cells than that.
    [[nodiscard]] std::vector<GridCoord> Regenerate(const GridMap& grid);

private:
    std::mt19937 m_rng;
};
} // namespace game::maps
