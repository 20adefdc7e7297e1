#include "game/gameplay/TurnEngine.hpp"

#include <utility>

#include "engine/persistence/SessionStore.hpp"
#include "game/gameplay/GameSession.hpp"
#include "game/gameplay/RoundLifecycle.hpp"

namespace game::gameplay
{
const char* EnginePhaseName(EnginePhase phase)
{
    switch (phase)
    {
        case EnginePhase::AwaitingAction: return "AwaitingAction";
        case EnginePhase::AwaitingRetreatConfirmation: return "AwaitingRetreatConfirmation";
        case EnginePhase::Victory: return "Victory";
        case EnginePhase::AllHeroesDead: return "AllHeroesDead";
        case EnginePhase::Quit: return "Quit";
        default: return "Unknown";
    }
}

TurnEngine::TurnEngine(
    GameSession& session,
    RoundLifecycle& rounds,
    engine::persistence::ISessionStore* store,
    GameEventBus* eventBus
)
    : m_session(&session)
    , m_rounds(&rounds)
    , m_store(store)
    , m_eventBus(eventBus)
{
}

void TurnEngine::Begin()
{
    m_phase = EnginePhase::AwaitingAction;
    m_pendingRetreat.reset();
    m_rounds->EnsureStarted(*m_session);

    TurnReport report;
    SettleActiveHero(report);
}

bool TurnEngine::IsFinished() const
{
    return m_phase == EnginePhase::Victory || m_phase == EnginePhase::AllHeroesDead || m_phase == EnginePhase::Quit;
}

const Hero* TurnEngine::ActiveHero() const
{
    return IsFinished() ? nullptr : m_session->ActiveHero();
}

std::vector<ActionOption> TurnEngine::AvailableActions() const
{
    std::vector<ActionOption> options;
    if (m_phase != EnginePhase::AwaitingAction)
    {
        return options;
    }
    const Hero* hero = m_session->ActiveHero();
    if (hero == nullptr)
    {
        return options;
    }

    for (std::size_t index : m_session->CoLocatedHeroes(m_session->TurnIndex()))
    {
        const Hero& other = m_session->Heroes()[index];
        options.push_back(ActionOption{ActionKind::Attack, "Attack " + other.Name() + " with sword", other.Name()});
    }

    const maps::Labyrinth& labyrinth = m_session->Labyrinth();
    if (labyrinth.KeyAt(hero->Position()))
    {
        options.push_back(ActionOption{ActionKind::PickUpKey, "Pick up the key", {}});
    }
    if (labyrinth.IsHeart(hero->Position()))
    {
        options.push_back(ActionOption{ActionKind::HealAtStation, "Restore health at the heart", {}});
    }

    options.push_back(ActionOption{ActionKind::Move, "Move hero", {}});
    options.push_back(ActionOption{ActionKind::SelfHeal, "Self-heal", {}});
    options.push_back(ActionOption{ActionKind::SaveGame, "Save game", {}});
    options.push_back(ActionOption{ActionKind::Quit, "Quit game", {}});
    return options;
}

TurnReport TurnEngine::Submit(const ActionChoice& choice)
{
    TurnReport report;
    report.phase = m_phase;

    if (IsFinished())
    {
        report.status = SubmitStatus::SessionOver;
        return report;
    }
    if (m_phase != EnginePhase::AwaitingAction)
    {
        report.status = SubmitStatus::InvalidChoice;
        return report;
    }

    Hero* hero = m_session->ActiveHero();
    if (hero == nullptr)
    {
        report.status = SubmitStatus::InvalidChoice;
        return report;
    }
    maps::Labyrinth& labyrinth = m_session->Labyrinth();

    switch (choice.kind)
    {
        case ActionKind::Attack:
        {
            Hero* target = nullptr;
            for (std::size_t index : m_session->CoLocatedHeroes(m_session->TurnIndex()))
            {
                if (m_session->Heroes()[index].Name() == choice.target)
                {
                    target = &m_session->Heroes()[index];
                    break;
                }
            }
            if (target == nullptr)
            {
                report.status = SubmitStatus::InvalidChoice;
                return report;
            }

            hero->Attack(*target);

            GameEvent event;
            event.type = GameEventType::HeroAttacked;
            event.hero = hero->Name();
            event.target = target->Name();
            event.cell = hero->Position();
            event.value = target->Health();
            Publish(std::move(event));

            report.status = SubmitStatus::TurnConsumed;
            EndTurn(report);
            return report;
        }
        case ActionKind::PickUpKey:
        {
            if (hero->PickUpKey(labyrinth) != ActionOutcome::Applied)
            {
                report.status = SubmitStatus::InvalidChoice;
                return report;
            }
            Publish(GameEvent{GameEventType::KeyPickedUp, hero->Name(), {}, hero->Position(), 0, {}});
            report.status = SubmitStatus::TurnConsumed;
            EndTurn(report);
            return report;
        }
        case ActionKind::HealAtStation:
        {
            if (!labyrinth.IsHeart(hero->Position()))
            {
                report.status = SubmitStatus::InvalidChoice;
                return report;
            }
            if (hero->HealAtStation(labyrinth) != ActionOutcome::Applied)
            {
                Publish(GameEvent{GameEventType::HealRefused, hero->Name(), {}, hero->Position(), hero->Health(), {}});
                report.status = SubmitStatus::NotApplicable;
                return report;
            }
            Publish(GameEvent{GameEventType::HealedAtStation, hero->Name(), {}, hero->Position(), hero->Health(), {}});
            report.status = SubmitStatus::TurnConsumed;
            EndTurn(report);
            return report;
        }
        case ActionKind::SelfHeal:
        {
            if (hero->SelfHeal() != ActionOutcome::Applied)
            {
                Publish(GameEvent{GameEventType::HealRefused, hero->Name(), {}, hero->Position(), hero->Health(), {}});
                report.status = SubmitStatus::NotApplicable;
                return report;
            }
            Publish(GameEvent{GameEventType::SelfHealed, hero->Name(), {}, hero->Position(), hero->Health(), {}});
            report.status = SubmitStatus::TurnConsumed;
            EndTurn(report);
            return report;
        }
        case ActionKind::Move:
            return ApplyMove(choice.direction, RetreatChoice::Ask);
        case ActionKind::SaveGame:
            return SaveSession();
        case ActionKind::Quit:
        {
            m_phase = EnginePhase::Quit;
            Publish(GameEvent{GameEventType::Quit, hero->Name(), {}, hero->Position(), 0, {}});
            report.status = SubmitStatus::SessionOver;
            report.phase = m_phase;
            return report;
        }
    }

    report.status = SubmitStatus::InvalidChoice;
    return report;
}

TurnReport TurnEngine::ConfirmRetreat(bool confirmed)
{
    if (m_phase != EnginePhase::AwaitingRetreatConfirmation || !m_pendingRetreat.has_value())
    {
        TurnReport report;
        report.status = IsFinished() ? SubmitStatus::SessionOver : SubmitStatus::InvalidChoice;
        report.phase = m_phase;
        return report;
    }

    const maps::Direction direction = *m_pendingRetreat;
    m_pendingRetreat.reset();
    m_phase = EnginePhase::AwaitingAction;
    return ApplyMove(direction, confirmed ? RetreatChoice::Confirm : RetreatChoice::Decline);
}

TurnReport TurnEngine::ApplyMove(maps::Direction direction, RetreatChoice retreatChoice)
{
    TurnReport report;
    Hero* hero = m_session->ActiveHero();
    if (hero == nullptr)
    {
        report.status = SubmitStatus::InvalidChoice;
        report.phase = m_phase;
        return report;
    }

    const MoveReport move = hero->Move(direction, m_session->Labyrinth(), retreatChoice);
    report.moveOutcome = move.outcome;

    GameEvent base;
    base.hero = hero->Name();
    base.cell = move.to;
    base.value = hero->Health();

    auto publish = [this, &base](GameEventType type) {
        GameEvent event = base;
        event.type = type;
        Publish(std::move(event));
    };

    switch (move.outcome)
    {
        case MoveOutcome::RetreatPending:
            m_pendingRetreat = direction;
            m_phase = EnginePhase::AwaitingRetreatConfirmation;
            report.status = SubmitStatus::RetreatConfirmationRequired;
            report.phase = m_phase;
            return report;
        case MoveOutcome::RetreatDeclined:
            publish(GameEventType::RetreatDeclined);
            report.status = SubmitStatus::RetreatDeclined;
            report.phase = m_phase;
            return report;
        case MoveOutcome::RetreatDeath:
            publish(GameEventType::HeroRetreatDeath);
            break;
        case MoveOutcome::Collided:
            publish(GameEventType::HeroCollided);
            break;
        case MoveOutcome::Moved:
        case MoveOutcome::SlainByGolem:
            publish(GameEventType::HeroMoved);
            if (move.caughtFire)
            {
                publish(GameEventType::HeroCaughtFire);
            }
            if (move.outcome == MoveOutcome::SlainByGolem)
            {
                publish(GameEventType::HeroSlainByGolem);
            }
            break;
        case MoveOutcome::Victory:
            publish(GameEventType::HeroMoved);
            publish(GameEventType::Victory);
            m_phase = EnginePhase::Victory;
            report.status = SubmitStatus::TurnConsumed;
            report.phase = m_phase;
            return report;
    }

    report.status = SubmitStatus::TurnConsumed;
    EndTurn(report);
    return report;
}

TurnReport TurnEngine::SaveSession()
{
    TurnReport report;
    report.phase = m_phase;

    const Hero* hero = m_session->ActiveHero();
    GameEvent event;
    event.hero = hero != nullptr ? hero->Name() : std::string{};

    std::string error;
    if (m_store != nullptr && m_store->Save(m_session->PlayerLogin(), m_session->ToSnapshot(), &error))
    {
        event.type = GameEventType::GameSaved;
        report.status = SubmitStatus::Saved;
    }
    else
    {
        event.type = GameEventType::SaveFailed;
        event.target = m_store != nullptr ? error : std::string{"no save store configured"};
        report.status = SubmitStatus::SaveFailed;
    }
    Publish(std::move(event));
    return report;
}

void TurnEngine::EndTurn(TurnReport& report)
{
    EliminateFallen(report);

    const Hero* hero = m_session->ActiveHero();
    if (hero != nullptr && hero->IsAlive())
    {
        if (m_session->AdvanceTurn())
        {
            StartNextRound(report);
        }
    }

    SettleActiveHero(report);
}

void TurnEngine::EliminateFallen(TurnReport& report)
{
    // Attack victims other than the active hero leave the roster right away.
    std::size_t index = m_session->Heroes().size();
    while (index > 0)
    {
        --index;
        if (index == m_session->TurnIndex() || m_session->Heroes()[index].IsAlive())
        {
            continue;
        }

        const Elimination fallen = m_session->EliminateHero(index);
        report.eliminated.push_back(fallen.heroName);
        Publish(GameEvent{GameEventType::HeroEliminated, fallen.heroName, {}, fallen.cell, 0, {}});
        if (fallen.droppedKey)
        {
            Publish(GameEvent{GameEventType::KeyDropped, fallen.heroName, {}, fallen.cell, 0, {}});
        }
    }
}

void TurnEngine::SettleActiveHero(TurnReport& report)
{
    while (!m_session->RosterEmpty())
    {
        const Hero* hero = m_session->ActiveHero();
        if (hero != nullptr && hero->IsAlive())
        {
            m_phase = EnginePhase::AwaitingAction;
            report.phase = m_phase;
            AnnounceTurn();
            return;
        }

        const Elimination fallen = m_session->EliminateHero(m_session->TurnIndex());
        report.eliminated.push_back(fallen.heroName);
        Publish(GameEvent{GameEventType::HeroEliminated, fallen.heroName, {}, fallen.cell, 0, {}});
        if (fallen.droppedKey)
        {
            Publish(GameEvent{GameEventType::KeyDropped, fallen.heroName, {}, fallen.cell, 0, {}});
        }
        if (fallen.turnWrapped)
        {
            StartNextRound(report);
        }
    }

    m_phase = EnginePhase::AllHeroesDead;
    report.phase = m_phase;
    Publish(GameEvent{GameEventType::AllHeroesDead, {}, {}, {0, 0}, m_session->Round(), {}});
}

void TurnEngine::StartNextRound(TurnReport& report)
{
    m_rounds->StartRound(*m_session);
    report.roundStarted = true;
}

void TurnEngine::AnnounceTurn()
{
    const Hero* hero = m_session->ActiveHero();
    if (hero == nullptr)
    {
        return;
    }
    Publish(GameEvent{GameEventType::TurnStarted, hero->Name(), {}, hero->Position(), hero->Health(), {}});
}

void TurnEngine::Publish(GameEvent event)
{
    if (m_eventBus != nullptr)
    {
        m_eventBus->Publish(std::move(event));
    }
}
} // namespace game::gameplay
