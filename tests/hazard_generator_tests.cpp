/*
Fire cell generation tests.
*/
#include "game/maps/HazardGenerator.hpp"

#include <stdio.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

using game::maps::GridCoord;
using game::maps::GridMap;
using game::maps::HazardGenerator;

static bool all_distinct(const std::vector<GridCoord>& cells)
{
    for (std::size_t i = 0; i < cells.size(); ++i)
    {
        for (std::size_t j = i + 1; j < cells.size(); ++j)
        {
            if (cells[i] == cells[j])
            {
                return false;
            }
        }
    }
    return true;
}

static int test_four_distinct_floor_cells()
{
    const GridMap grid = GridMap::Default();
    HazardGenerator generator(1234u);
    for (int i = 0; i < 500; ++i)
    {
        const std::vector<GridCoord> hazards = generator.Regenerate(grid);
        EXPECT(hazards.size() == 4u, "four hazards per round");
        EXPECT(all_distinct(hazards), "hazards are distinct");
        for (const GridCoord& cell : hazards)
        {
            EXPECT(grid.IsFloor(cell), "hazards only on plain floor");
        }
    }
    return 0;
}

static int test_every_floor_cell_reachable()
{
    const GridMap grid = GridMap::Default();
    const std::vector<GridCoord> floor = grid.FloorCells();
    std::vector<int> hits(floor.size(), 0);

    HazardGenerator generator(99u);
    for (int i = 0; i < 2000; ++i)
    {
        for (const GridCoord& cell : generator.Regenerate(grid))
        {
            const auto it = std::find(floor.begin(), floor.end(), cell);
            hits[static_cast<std::size_t>(it - floor.begin())] += 1;
        }
    }
    for (int count : hits)
    {
        EXPECT(count > 0, "every floor cell eventually burns");
    }
    return 0;
}

static int test_seed_is_reproducible()
{
    const GridMap grid = GridMap::Default();
    HazardGenerator a(42u);
    HazardGenerator b(42u);
    for (int i = 0; i < 20; ++i)
    {
        EXPECT(a.Regenerate(grid) == b.Regenerate(grid), "same seed gives same rounds");
    }
    return 0;
}

static int test_exactly_four_floor_cells()
{
    std::vector<std::vector<int>> codes(GridMap::kRows, std::vector<int>(GridMap::kColumns, 2));
    codes[3][4] = 1;
    codes[3][5] = 1;
    codes[3][6] = 1;
    codes[3][7] = 1;
    const std::optional<GridMap> grid = GridMap::FromCodes(codes);
    EXPECT(grid.has_value(), "custom grid");

    HazardGenerator generator(5u);
    std::vector<GridCoord> hazards = generator.Regenerate(*grid);
    std::sort(hazards.begin(), hazards.end(), [](const GridCoord& l, const GridCoord& r) { return l.y < r.y; });
    EXPECT(hazards[0] == GridCoord(3, 4) && hazards[3] == GridCoord(3, 7), "all four floor cells burn");
    return 0;
}

static int test_too_few_floor_cells_throws()
{
    std::vector<std::vector<int>> codes(GridMap::kRows, std::vector<int>(GridMap::kColumns, 0));
    codes[0][0] = 1;
    codes[0][1] = 1;
    codes[0][2] = 1;
    const std::optional<GridMap> grid = GridMap::FromCodes(codes);
    EXPECT(grid.has_value(), "sparse grid");

    HazardGenerator generator(5u);
    bool threw = false;
    try
    {
        (void)generator.Regenerate(*grid);
    }
    catch (const std::logic_error&)
    {
        threw = true;
    }
    EXPECT(threw, "three floor cells cannot host four hazards");
    return 0;
}

int main(void)
{
    if (test_four_distinct_floor_cells() != 0) return 1;
    if (test_every_floor_cell_reachable() != 0) return 1;
    if (test_seed_is_reproducible() != 0) return 1;
    if (test_exactly_four_floor_cells() != 0) return 1;
    if (test_too_few_floor_cells_throws() != 0) return 1;
    return 0;
}
