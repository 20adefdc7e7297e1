#include "game/maps/GridMap.hpp"

#include <stdexcept>
#include <string>

namespace game::maps
{
namespace
{
constexpr int kDefaultCodes[GridMap::kRows][GridMap::kColumns]{
    {0, 0, 0, 0, 2, 1, 1, 1},
    {0, 0, 2, 0, 0, 1, 0, 0},
    {0, 1, 1, 1, 0, 1, 2, 0},
    {1, 1, 0, 1, 1, 1, 0, 0},
};
} // namespace

GridMap::GridMap()
{
    for (auto& row : m_cells)
    {
        row.fill(CellCode::Wall);
    }
}

GridMap::GridMap(const Rows& rows)
    : m_cells(rows)
{
}

GridMap GridMap::Default()
{
    Rows rows{};
    for (int x = 0; x < kRows; ++x)
    {
        for (int y = 0; y < kColumns; ++y)
        {
            rows[x][y] = static_cast<CellCode>(kDefaultCodes[x][y]);
        }
    }
    return GridMap(rows);
}

std::optional<GridMap> GridMap::FromCodes(const std::vector<std::vector<int>>& codes)
{
    if (codes.size() != static_cast<std::size_t>(kRows))
    {
        return std::nullopt;
    }

    Rows rows{};
    for (int x = 0; x < kRows; ++x)
    {
        const std::vector<int>& source = codes[static_cast<std::size_t>(x)];
        if (source.size() != static_cast<std::size_t>(kColumns))
        {
            return std::nullopt;
        }
        for (int y = 0; y < kColumns; ++y)
        {
            const int code = source[static_cast<std::size_t>(y)];
            if (code < 0 || code > 2)
            {
                return std::nullopt;
            }
            rows[x][y] = static_cast<CellCode>(code);
        }
    }
    return GridMap(rows);
}

bool GridMap::InBounds(const GridCoord& cell) const
{
    return cell.x >= 0 && cell.x < kRows && cell.y >= 0 && cell.y < kColumns;
}

bool GridMap::IsPassable(const GridCoord& cell) const
{
    if (!InBounds(cell))
    {
        return false;
    }
    const CellCode code = m_cells[cell.x][cell.y];
    return code == CellCode::Floor || code == CellCode::SpecialFloor;
}

bool GridMap::IsFloor(const GridCoord& cell) const
{
    return InBounds(cell) && m_cells[cell.x][cell.y] == CellCode::Floor;
}

CellCode GridMap::CellCodeAt(const GridCoord& cell) const
{
    if (!InBounds(cell))
    {
        throw std::out_of_range(
            "grid cell (" + std::to_string(cell.x) + ", " + std::to_string(cell.y) + ") is outside the labyrinth"
        );
    }
    return m_cells[cell.x][cell.y];
}

std::vector<GridCoord> GridMap::FloorCells() const
{
    std::vector<GridCoord> cells;
    for (int x = 0; x < kRows; ++x)
    {
        for (int y = 0; y < kColumns; ++y)
        {
            if (m_cells[x][y] == CellCode::Floor)
            {
                cells.emplace_back(x, y);
            }
        }
    }
    return cells;
}

std::vector<std::vector<int>> GridMap::ToCodes() const
{
    std::vector<std::vector<int>> codes;
    codes.reserve(kRows);
    for (const auto& row : m_cells)
    {
        std::vector<int>& out = codes.emplace_back();
        out.reserve(kColumns);
        for (CellCode code : row)
        {
            out.push_back(static_cast<int>(code));
        }
    }
    return codes;
}

GridCoord GridMap::Step(const GridCoord& from, Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return GridCoord{from.x - 1, from.y};
        case Direction::Down: return GridCoord{from.x + 1, from.y};
        case Direction::Left: return GridCoord{from.x, from.y - 1};
        case Direction::Right: return GridCoord{from.x, from.y + 1};
    }
    return from;
}

const char* GridMap::DirectionName(Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
        case Direction::Left: return "Left";
        case Direction::Right: return "Right";
        default: return "Unknown";
    }
}
} // namespace game::maps
