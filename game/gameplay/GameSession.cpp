#include "game/gameplay/GameSession.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "game/maps/HazardGenerator.hpp"

namespace game::gameplay
{
namespace
{
bool ValidHeroState(const HeroState& hero, const maps::GridMap& grid)
{
    return !hero.name.empty() && hero.health <= Hero::kMaxHealth && hero.remainingSelfHeals >= 0 &&
           grid.IsPassable(hero.position) && grid.InBounds(hero.previousPosition);
}

// A started round always carries a full set of distinct plain-floor fire cells.
bool ValidHazards(const std::vector<maps::GridCoord>& hazards, int round, const maps::GridMap& grid)
{
    if (round == 0)
    {
        return hazards.empty();
    }
    if (hazards.size() != static_cast<std::size_t>(maps::HazardGenerator::kHazardsPerRound))
    {
        return false;
    }
    for (std::size_t i = 0; i < hazards.size(); ++i)
    {
        if (!grid.IsFloor(hazards[i]))
        {
            return false;
        }
        if (std::find(hazards.begin() + static_cast<std::ptrdiff_t>(i) + 1, hazards.end(), hazards[i]) != hazards.end())
        {
            return false;
        }
    }
    return true;
}
} // namespace

const char* RosterErrorText(RosterError error)
{
    switch (error)
    {
        case RosterError::None: return "ok";
        case RosterError::RosterFull: return "the roster is full";
        case RosterError::EmptyName: return "a hero needs a name";
        case RosterError::DuplicateName: return "hero names must be unique";
        default: return "unknown";
    }
}

GameSession::GameSession(std::string playerLogin, int maxHeroes)
    : m_playerLogin(std::move(playerLogin))
    , m_maxHeroes(std::clamp(maxHeroes, 1, kMaxHeroes))
{
}

std::optional<GameSession> GameSession::FromSnapshot(
    std::string playerLogin,
    const SessionSnapshot& snapshot,
    int maxHeroes
)
{
    const std::optional<maps::GridMap> grid = maps::GridMap::FromCodes(snapshot.labyrinth.grid);
    if (!grid.has_value() || grid->FloorCells().size() < static_cast<std::size_t>(maps::HazardGenerator::kHazardsPerRound))
    {
        return std::nullopt;
    }
    if (snapshot.round < 0 || snapshot.turnIndex < 0)
    {
        return std::nullopt;
    }
    if (snapshot.heroes.empty() ? snapshot.turnIndex != 0
                                : static_cast<std::size_t>(snapshot.turnIndex) >= snapshot.heroes.size())
    {
        return std::nullopt;
    }
    if (!grid->InBounds(snapshot.labyrinth.keyCell) || !grid->InBounds(snapshot.labyrinth.golemCell))
    {
        return std::nullopt;
    }
    if (!ValidHazards(snapshot.hazards, snapshot.round, *grid) || snapshot.labyrinth.hazards != snapshot.hazards)
    {
        return std::nullopt;
    }

    GameSession session(std::move(playerLogin), maxHeroes);
    if (snapshot.heroes.size() > static_cast<std::size_t>(kMaxHeroes))
    {
        return std::nullopt;
    }

    for (const HeroState& hero : snapshot.heroes)
    {
        if (!ValidHeroState(hero, *grid))
        {
            return std::nullopt;
        }
        const bool duplicate = std::any_of(session.m_heroes.begin(), session.m_heroes.end(), [&](const Hero& existing) {
            return existing.Name() == hero.name;
        });
        if (duplicate)
        {
            return std::nullopt;
        }
        session.m_heroes.emplace_back(hero);
    }

    session.m_round = snapshot.round;
    session.m_turnIndex = static_cast<std::size_t>(snapshot.turnIndex);
    session.m_labyrinth.SetGrid(*grid);
    session.m_labyrinth.SetKeyState(snapshot.labyrinth.keyPresent, snapshot.labyrinth.keyCell);
    session.m_labyrinth.SetGolemCell(snapshot.labyrinth.golemCell);
    session.m_labyrinth.SetHazards(snapshot.hazards);
    return session;
}

SessionSnapshot GameSession::ToSnapshot() const
{
    SessionSnapshot snapshot;
    snapshot.round = m_round;
    snapshot.turnIndex = static_cast<int>(m_turnIndex);
    snapshot.hazards = m_labyrinth.Hazards();
    snapshot.heroes.reserve(m_heroes.size());
    for (const Hero& hero : m_heroes)
    {
        snapshot.heroes.push_back(hero.State());
    }
    snapshot.labyrinth.grid = m_labyrinth.Grid().ToCodes();
    snapshot.labyrinth.hazards = m_labyrinth.Hazards();
    snapshot.labyrinth.keyCell = m_labyrinth.KeyCell();
    snapshot.labyrinth.keyPresent = m_labyrinth.KeyPresent();
    snapshot.labyrinth.golemCell = m_labyrinth.GolemCell();
    return snapshot;
}

RosterError GameSession::ValidateHeroName(const std::string& name) const
{
    if (m_heroes.size() >= static_cast<std::size_t>(m_maxHeroes))
    {
        return RosterError::RosterFull;
    }
    if (name.empty())
    {
        return RosterError::EmptyName;
    }
    const bool taken = std::any_of(m_heroes.begin(), m_heroes.end(), [&name](const Hero& hero) {
        return hero.Name() == name;
    });
    return taken ? RosterError::DuplicateName : RosterError::None;
}

RosterError GameSession::AddHero(const std::string& name)
{
    const RosterError error = ValidateHeroName(name);
    if (error != RosterError::None)
    {
        return error;
    }
    m_heroes.emplace_back(name);
    return RosterError::None;
}

Hero* GameSession::ActiveHero()
{
    return m_turnIndex < m_heroes.size() ? &m_heroes[m_turnIndex] : nullptr;
}

const Hero* GameSession::ActiveHero() const
{
    return m_turnIndex < m_heroes.size() ? &m_heroes[m_turnIndex] : nullptr;
}

std::vector<std::size_t> GameSession::CoLocatedHeroes(std::size_t index) const
{
    std::vector<std::size_t> result;
    if (index >= m_heroes.size())
    {
        return result;
    }

    const Hero& self = m_heroes[index];
    for (std::size_t i = 0; i < m_heroes.size(); ++i)
    {
        if (i == index)
        {
            continue;
        }
        const Hero& other = m_heroes[i];
        if (other.IsAlive() && other.Position() == self.Position())
        {
            result.push_back(i);
        }
    }
    return result;
}

void GameSession::BeginRound(std::vector<maps::GridCoord> hazards)
{
    ++m_round;
    m_labyrinth.SetHazards(std::move(hazards));
}

bool GameSession::AdvanceTurn()
{
    if (m_heroes.empty())
    {
        m_turnIndex = 0;
        return false;
    }
    m_turnIndex = (m_turnIndex + 1) % m_heroes.size();
    return m_turnIndex == 0;
}

Elimination GameSession::EliminateHero(std::size_t index)
{
    Elimination result;
    if (index >= m_heroes.size())
    {
        return result;
    }

    const Hero& fallen = m_heroes[index];
    result.heroName = fallen.Name();
    result.cell = fallen.Position();
    if (fallen.HasKey())
    {
        m_labyrinth.DropKey(fallen.Position());
        result.droppedKey = true;
    }

    m_heroes.erase(m_heroes.begin() + static_cast<std::ptrdiff_t>(index));

    if (m_heroes.empty())
    {
        m_turnIndex = 0;
        return result;
    }
    if (index < m_turnIndex)
    {
        --m_turnIndex;
    }
    else if (m_turnIndex >= m_heroes.size())
    {
        m_turnIndex = 0;
        result.turnWrapped = true;
    }
    return result;
}
} // namespace game::gameplay
