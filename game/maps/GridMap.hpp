#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include <glm/vec2.hpp>

namespace game::maps
{
/// Grid cell address. x is the row, y is the column.
using GridCoord = glm::ivec2;

enum class CellCode : std::uint8_t
{
    Wall = 0,
    Floor = 1,
    SpecialFloor = 2
};

enum class Direction
{
    Up = 0,
    Down,
    Left,
    Right
};

class GridMap
{
public:
    static constexpr int kRows = 4;
    static constexpr int kColumns = 8;

    using Rows = std::array<std::array<CellCode, kColumns>, kRows>;

    GridMap();
    explicit GridMap(const Rows& rows);

    [[nodiscard]] static GridMap Default();

    /// Builds a grid from raw integer codes. Returns nullopt when the shape is not
    /// kRows x kColumns or a code is outside 0..2.
    [[nodiscard]] static std::optional<GridMap> FromCodes(const std::vector<std::vector<int>>& codes);

    [[nodiscard]] bool InBounds(const GridCoord& cell) const;
    [[nodiscard]] bool IsPassable(const GridCoord& cell) const;
    [[nodiscard]] bool IsFloor(const GridCoord& cell) const;

    /// Terrain code of an in-bounds cell. Throws std::out_of_range otherwise.
    [[nodiscard]] CellCode CellCodeAt(const GridCoord& cell) const;

    [[nodiscard]] std::vector<GridCoord> FloorCells() const;
    [[nodiscard]] std::vector<std::vector<int>> ToCodes() const;

    [[nodiscard]] static GridCoord Step(const GridCoord& from, Direction direction);
    [[nodiscard]] static const char* DirectionName(Direction direction);

    bool operator==(const GridMap& other) const { return m_cells == other.m_cells; }

private:
    Rows m_cells{};
};
} // namespace game::maps
