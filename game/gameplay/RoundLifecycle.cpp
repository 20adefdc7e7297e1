#include "game/gameplay/RoundLifecycle.hpp"

#include <utility>

#include "game/gameplay/GameSession.hpp"
#include "game/maps/HazardGenerator.hpp"

namespace game::gameplay
{
RoundLifecycle::RoundLifecycle(maps::HazardGenerator& hazards, GameEventBus* eventBus)
    : m_hazards(&hazards)
    , m_eventBus(eventBus)
{
}

void RoundLifecycle::StartRound(GameSession& session)
{
    session.BeginRound(m_hazards->Regenerate(session.Labyrinth().Grid()));

    if (m_eventBus != nullptr)
    {
        GameEvent event;
        event.type = GameEventType::RoundStarted;
        event.value = session.Round();
        event.cells = session.Labyrinth().Hazards();
        m_eventBus->Publish(std::move(event));
    }
}

bool RoundLifecycle::EnsureStarted(GameSession& session)
{
    if (session.Round() > 0)
    {
        return false;
    }
    StartRound(session);
    return true;
}
} // namespace game::gameplay
