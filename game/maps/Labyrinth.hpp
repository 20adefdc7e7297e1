#pragma once

#include <utility>
#include <vector>

#include "game/maps/GridMap.hpp"

namespace game::maps
{
class Labyrinth
{
public:
    Labyrinth();

    [[nodiscard]] const GridMap& Grid() const { return m_grid; }
    void SetGrid(const GridMap& grid) { m_grid = grid; }

    [[nodiscard]] bool KeyPresent() const { return m_keyPresent; }
    [[nodiscard]] const GridCoord& KeyCell() const { return m_keyCell; }
    [[nodiscard]] bool KeyAt(const GridCoord& cell) const;
    bool TakeKey(const GridCoord& cell);
    void DropKey(const GridCoord& cell);
    void SetKeyState(bool present, const GridCoord& cell);

    [[nodiscard]] bool IsHeart(const GridCoord& cell) const;

    [[nodiscard]] const GridCoord& GolemCell() const { return m_golemCell; }
    void SetGolemCell(const GridCoord& cell) { m_golemCell = cell; }

    [[nodiscard]] const std::vector<GridCoord>& Hazards() const { return m_hazards; }
    [[nodiscard]] bool IsHazard(const GridCoord& cell) const;
    void SetHazards(std::vector<GridCoord> hazards) { m_hazards = std::move(hazards); }

    [[nodiscard]] static GridCoord StartCell() { return GridCoord{3, 0}; }
    [[nodiscard]] static GridCoord StartPreviousCell() { return GridCoord{0, 0}; }

private:
    GridMap m_grid;
    bool m_keyPresent = true;
    GridCoord m_keyCell{1, 2};
    std::vector<GridCoord> m_hearts;
    GridCoord m_golemCell{0, 7};
    std::vector<GridCoord> m_hazards;
};
} // namespace game::maps
