#include "game/gameplay/Hero.hpp"

#include <utility>

#include "game/maps/Labyrinth.hpp"

namespace game::gameplay
{
Hero::Hero(std::string name)
{
    m_state.name = std::move(name);
}

Hero::Hero(HeroState state)
    : m_state(std::move(state))
{
}

void Hero::Attack(Hero& target) const
{
    target.m_state.health -= 1;
}

ActionOutcome Hero::PickUpKey(maps::Labyrinth& labyrinth)
{
    if (!labyrinth.TakeKey(m_state.position))
    {
        return ActionOutcome::NotApplicable;
    }
    m_state.hasKey = true;
    return ActionOutcome::Applied;
}

ActionOutcome Hero::HealAtStation(const maps::Labyrinth& labyrinth)
{
    if (!labyrinth.IsHeart(m_state.position) || m_state.health >= kMaxHealth)
    {
        return ActionOutcome::NotApplicable;
    }
    m_state.health = kMaxHealth;
    return ActionOutcome::Applied;
}

ActionOutcome Hero::SelfHeal()
{
    if (m_state.remainingSelfHeals <= 0 || m_state.health >= kMaxHealth)
    {
        return ActionOutcome::NotApplicable;
    }
    m_state.health += 1;
    m_state.remainingSelfHeals -= 1;
    return ActionOutcome::Applied;
}

bool Hero::IsRetreat(maps::Direction direction, const maps::Labyrinth& labyrinth) const
{
    const maps::GridMap& grid = labyrinth.Grid();
    const maps::GridCoord target = maps::GridMap::Step(m_state.position, direction);
    return grid.IsPassable(target) && target == m_state.previousPosition && grid.IsFloor(m_state.position);
}

MoveReport Hero::Move(maps::Direction direction, const maps::Labyrinth& labyrinth, RetreatChoice retreatChoice)
{
    const maps::GridMap& grid = labyrinth.Grid();

    MoveReport report;
    report.from = m_state.position;
    report.to = maps::GridMap::Step(m_state.position, direction);

    if (!grid.IsPassable(report.to))
    {
        m_state.health -= 1;
        report.to = report.from;
        report.outcome = MoveOutcome::Collided;
        return report;
    }

    if (IsRetreat(direction, labyrinth))
    {
        switch (retreatChoice)
        {
            case RetreatChoice::Ask:
                report.to = report.from;
                report.outcome = MoveOutcome::RetreatPending;
                return report;
            case RetreatChoice::Decline:
                report.to = report.from;
                report.outcome = MoveOutcome::RetreatDeclined;
                return report;
            case RetreatChoice::Confirm:
                m_state.health = 0;
                report.to = report.from;
                report.outcome = MoveOutcome::RetreatDeath;
                return report;
        }
    }

    // Special-floor cells (key, hearts) neither trigger the retreat rule nor update the trail.
    if (grid.IsFloor(m_state.position))
    {
        m_state.previousPosition = m_state.position;
    }
    m_state.position = report.to;

    // Handing the key to the golem ends the game before anything else resolves.
    if (m_state.position == labyrinth.GolemCell() && m_state.hasKey)
    {
        report.outcome = MoveOutcome::Victory;
        return report;
    }

    if (labyrinth.IsHazard(m_state.position))
    {
        m_state.health -= 1;
        report.caughtFire = true;
    }

    if (m_state.position == labyrinth.GolemCell())
    {
        m_state.health = 0;
        report.outcome = MoveOutcome::SlainByGolem;
        return report;
    }

    report.outcome = MoveOutcome::Moved;
    return report;
}
} // namespace game::gameplay
