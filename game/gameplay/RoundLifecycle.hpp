#pragma once

#include "game/gameplay/GameEvents.hpp"

namespace game::maps
{
class HazardGenerator;
}

namespace game::gameplay
{
class GameSession;

class RoundLifecycle
{
public:
    explicit RoundLifecycle(maps::HazardGenerator& hazards, GameEventBus* eventBus = nullptr);

    void StartRound(GameSession& session);

    bool EnsureStarted(GameSession& session);

private:
    maps::HazardGenerator* m_hazards = nullptr;
    GameEventBus* m_eventBus = nullptr;
};
} // namespace game::gameplay
