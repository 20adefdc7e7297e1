#include "game/maps/Labyrinth.hpp"

#include <algorithm>

namespace game::maps
{
Labyrinth::Labyrinth()
    : m_grid(GridMap::Default())
    , m_hearts{GridCoord{0, 4}, GridCoord{2, 6}}
{
}

bool Labyrinth::KeyAt(const GridCoord& cell) const
{
    return m_keyPresent && m_keyCell == cell;
}

bool Labyrinth::TakeKey(const GridCoord& cell)
{
    if (!KeyAt(cell))
    {
        return false;
    }
    m_keyPresent = false;
    return true;
}

void Labyrinth::DropKey(const GridCoord& cell)
{
    m_keyPresent = true;
    m_keyCell = cell;
}

void Labyrinth::SetKeyState(bool present, const GridCoord& cell)
{
    m_keyPresent = present;
    m_keyCell = cell;
}

bool Labyrinth::IsHeart(const GridCoord& cell) const
{
    return std::find(m_hearts.begin(), m_hearts.end(), cell) != m_hearts.end();
}

bool Labyrinth::IsHazard(const GridCoord& cell) const
{
    return std::find(m_hazards.begin(), m_hazards.end(), cell) != m_hazards.end();
}
} // namespace game::maps
