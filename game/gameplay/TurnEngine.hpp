#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "game/gameplay/GameEvents.hpp"
#include "game/gameplay/Hero.hpp"
#include "game/maps/GridMap.hpp"

namespace engine::persistence
{
class ISessionStore;
}

namespace game::gameplay
{
class GameSession;
class RoundLifecycle;

enum class ActionKind
{
    Attack,
    PickUpKey,
    HealAtStation,
    Move,
    SelfHeal,
    SaveGame,
    Quit
};

struct ActionOption
{
    ActionKind kind = ActionKind::Move;
    std::string label;
    std::string target;
};

struct ActionChoice
{
    ActionKind kind = ActionKind::Move;
    std::string target;
    maps::Direction direction = maps::Direction::Up;
};

enum class EnginePhase
{
    AwaitingAction,
    AwaitingRetreatConfirmation,
    Victory,
    AllHeroesDead,
    Quit
};

enum class SubmitStatus
{
    TurnConsumed,
    NotApplicable,        ///< Precondition failed; same hero chooses again.
    Saved,
    SaveFailed,
    RetreatConfirmationRequired,
    RetreatDeclined,
    InvalidChoice,        ///< Action not on offer in the current state.
    SessionOver
};

struct TurnReport
{
    SubmitStatus status = SubmitStatus::InvalidChoice;
    EnginePhase phase = EnginePhase::AwaitingAction;
    std::optional<MoveOutcome> moveOutcome;
    std::vector<std::string> eliminated;
    bool roundStarted = false;

    [[nodiscard]] bool TurnConsumed() const { return status == SubmitStatus::TurnConsumed; }
};

[[nodiscard]] const char* EnginePhaseName(EnginePhase phase);

class TurnEngine
{
public:
    TurnEngine(
        GameSession& session,
        RoundLifecycle& rounds,
        engine::persistence::ISessionStore* store = nullptr,
        GameEventBus* eventBus = nullptr
    );

    /// Starts round 1 if needed and settles the first active hero. Call once before acting.
    void Begin();

    [[nodiscard]] EnginePhase Phase() const { return m_phase; }
    [[nodiscard]] bool IsFinished() const;
    [[nodiscard]] const Hero* ActiveHero() const;
    [[nodiscard]] const GameSession& Session() const { return *m_session; }

    /// Contextual actions (attacks, key, heart) followed by Move, SelfHeal, SaveGame, Quit.
    [[nodiscard]] std::vector<ActionOption> AvailableActions() const;

    TurnReport Submit(const ActionChoice& choice);

    /// Resolves a pending retreat. Declining keeps the same hero in action selection.
    TurnReport ConfirmRetreat(bool confirmed);

private:
    TurnReport ApplyMove(maps::Direction direction, RetreatChoice retreatChoice);
    TurnReport SaveSession();
    void EndTurn(TurnReport& report);
    void SettleActiveHero(TurnReport& report);
    void EliminateFallen(TurnReport& report);
    void StartNextRound(TurnReport& report);
    void AnnounceTurn();
    void Publish(GameEvent event);

    GameSession* m_session = nullptr;
    RoundLifecycle* m_rounds = nullptr;
    engine::persistence::ISessionStore* m_store = nullptr;
    GameEventBus* m_eventBus = nullptr;
    EnginePhase m_phase = EnginePhase::AwaitingAction;
    std::optional<maps::Direction> m_pendingRetreat;
};
} // namespace game::gameplay
