#pragma once

#include <string>

#include "game/maps/GridMap.hpp"
#include "game/maps/Labyrinth.hpp"

namespace game::gameplay
{
/// Persistent hero fields. Health may dip below zero for the instant between a
/// hit and the liveness check that removes the hero.
struct HeroState
{
    std::string name;
    int health = 5;
    bool hasKey = false;
    maps::GridCoord position = maps::Labyrinth::StartCell();
    maps::GridCoord previousPosition = maps::Labyrinth::StartPreviousCell();
    int remainingSelfHeals = 3;

    bool operator==(const HeroState& other) const = default;
};

enum class ActionOutcome
{
    Applied,
    NotApplicable
};

enum class RetreatChoice
{
    Ask,
    Confirm,
    Decline
};

enum class MoveOutcome
{
    Moved,
    Collided,
    RetreatPending,
    RetreatDeclined,
    RetreatDeath,
    SlainByGolem,
    Victory
};

struct MoveReport
{
    MoveOutcome outcome = MoveOutcome::Moved;
    maps::GridCoord from{0, 0};
    maps::GridCoord to{0, 0};
    bool caughtFire = false;

    [[nodiscard]] bool ConsumesTurn() const
    {
        return outcome != MoveOutcome::RetreatPending && outcome != MoveOutcome::RetreatDeclined;
    }
};

class Hero
{
public:
    static constexpr int kMaxHealth = 5;
    static constexpr int kStartingSelfHeals = 3;

    explicit Hero(std::string name);
    explicit Hero(HeroState state);

    [[nodiscard]] const HeroState& State() const { return m_state; }
    [[nodiscard]] const std::string& Name() const { return m_state.name; }
    [[nodiscard]] int Health() const { return m_state.health; }
    [[nodiscard]] bool HasKey() const { return m_state.hasKey; }
    [[nodiscard]] const maps::GridCoord& Position() const { return m_state.position; }
    [[nodiscard]] const maps::GridCoord& PreviousPosition() const { return m_state.previousPosition; }
    [[nodiscard]] int RemainingSelfHeals() const { return m_state.remainingSelfHeals; }
    [[nodiscard]] bool IsAlive() const { return m_state.health > 0; }

    void SetSelfHealCharges(int charges) { m_state.remainingSelfHeals = charges; }

    void Attack(Hero& target) const;
    ActionOutcome PickUpKey(maps::Labyrinth& labyrinth);
    ActionOutcome HealAtStation(const maps::Labyrinth& labyrinth);
    ActionOutcome SelfHeal();

    /// Stepping this way would walk back onto the previous cell after leaving plain floor.
    [[nodiscard]] bool IsRetreat(maps::Direction direction, const maps::Labyrinth& labyrinth) const;

    /// One-step move with wall, retreat, fire and golem resolution.
    /// With RetreatChoice::Ask a retreat is reported as RetreatPending and nothing changes.
    MoveReport Move(maps::Direction direction, const maps::Labyrinth& labyrinth, RetreatChoice retreatChoice);

private:
    HeroState m_state;
};
} // namespace game::gameplay
