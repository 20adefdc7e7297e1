#include "game/maps/HazardGenerator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace game::maps
{
HazardGenerator::HazardGenerator()
    : m_rng(std::random_device{}())
{
}

HazardGenerator::HazardGenerator(unsigned int seed)
    : m_rng(seed)
{
}

std::vector<GridCoord> HazardGenerator::Regenerate(const GridMap& grid)
{
    const std::size_t floorCount = grid.FloorCells().size();
    if (floorCount < static_cast<std::size_t>(kHazardsPerRound))
    {
        throw std::logic_error(
            "labyrinth has " + std::to_string(floorCount) + " floor cells, need at least " +
            std::to_string(kHazardsPerRound) + " for hazards"
        );
    }

    // Rejection sampling over the whole grid keeps every floor cell equally likely.
    std::uniform_int_distribution<int> rowDist(0, GridMap::kRows - 1);
    std::uniform_int_distribution<int> columnDist(0, GridMap::kColumns - 1);

    std::vector<GridCoord> hazards;
    hazards.reserve(kHazardsPerRound);
    while (hazards.size() != static_cast<std::size_t>(kHazardsPerRound))
    {
        const GridCoord candidate{rowDist(m_rng), columnDist(m_rng)};
        if (!grid.IsFloor(candidate))
        {
            continue;
        }
        if (std::find(hazards.begin(), hazards.end(), candidate) != hazards.end())
        {
            continue;
        }
        hazards.push_back(candidate);
    }
    return hazards;
}
} // namespace game::maps
