#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "engine/core/EventBus.hpp"
#include "game/maps/GridMap.hpp"

namespace game::gameplay
{
enum class GameEventType : std::uint8_t
{
    RoundStarted = 0,
    TurnStarted,
    HeroMoved,
    HeroCollided,
    HeroCaughtFire,
    HeroSlainByGolem,
    HeroRetreatDeath,
    RetreatDeclined,
    HeroAttacked,
    KeyPickedUp,
    HealedAtStation,
    SelfHealed,
    HealRefused,
    HeroEliminated,
    KeyDropped,
    GameSaved,
    SaveFailed,
    Victory,
    AllHeroesDead,
    Quit
};

struct GameEvent
{
    GameEventType type = GameEventType::TurnStarted;
    std::string hero;
    std::string target;
    maps::GridCoord cell{0, 0};
    int value = 0;
    std::vector<maps::GridCoord> cells;
};

using GameEventBus = engine::core::EventBus<GameEvent>;

[[nodiscard]] const char* EventTypeName(GameEventType type);

[[nodiscard]] std::string DescribeEvent(const GameEvent& event);

[[nodiscard]] std::string FormatCell(const maps::GridCoord& cell);
} // namespace game::gameplay
