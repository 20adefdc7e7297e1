#include "engine/core/App.hpp"

#include <iostream>
#include <optional>
#include <utility>

#include "engine/persistence/SessionStore.hpp"
#include "game/gameplay/GameEvents.hpp"
#include "game/gameplay/GameSession.hpp"
#include "game/gameplay/RoundLifecycle.hpp"
#include "game/gameplay/TurnEngine.hpp"
#include "game/maps/HazardGenerator.hpp"
#include "ui/ConsoleFrontend.hpp"

namespace engine::core
{
App::App(std::string configPath)
    : m_configPath(std::move(configPath))
{
}

void App::LoadConfig()
{
    std::string status;
    if (!LoadAppConfig(m_configPath, m_config, &status))
    {
        std::cerr << "[Config] " << status << "\n";
        return;
    }
    if (!status.empty())
    {
        std::cout << "[Config] " << status << "\n";
    }
}

bool App::Run(std::istream& in, std::ostream& out)
{
    LoadConfig();

    persistence::JsonSessionStore store(m_config.saveFile);
    ui::ConsoleFrontend frontend(in, out);

    const std::optional<std::string> login = frontend.PromptLogin();
    if (!login.has_value())
    {
        return true;
    }

    std::optional<game::gameplay::GameSession> session;
    if (store.Contains(*login))
    {
        const std::optional<bool> resume = frontend.PromptYesNo("A saved game was found. Continue it?");
        if (!resume.has_value())
        {
            return true;
        }

        if (*resume)
        {
            const std::optional<game::gameplay::SessionSnapshot> snapshot = store.Load(*login);
            if (snapshot.has_value())
            {
                session = game::gameplay::GameSession::FromSnapshot(*login, *snapshot, m_config.maxHeroes);
            }
            if (!session.has_value())
            {
                std::cerr << "[SaveStore] Save for " << *login << " is unusable. Starting a new game.\n";
            }
        }
        else
        {
            std::string error;
            if (!store.Remove(*login, &error))
            {
                std::cerr << "[SaveStore] " << error << "\n";
            }
        }
    }

    if (!session.has_value())
    {
        session.emplace(*login, m_config.maxHeroes);
        if (!frontend.SetupRoster(*session))
        {
            return true;
        }
    }

    game::maps::HazardGenerator hazards = m_config.hazardSeed != 0
        ? game::maps::HazardGenerator(m_config.hazardSeed)
        : game::maps::HazardGenerator();
    game::gameplay::GameEventBus eventBus;
    game::gameplay::RoundLifecycle rounds(hazards, &eventBus);
    game::gameplay::TurnEngine engine(*session, rounds, &store, &eventBus);

    if (m_config.logEvents)
    {
        frontend.AttachEventLog(eventBus, *session);
    }

    frontend.Info("Game started for " + *login + ".");
    engine.Begin();
    const game::gameplay::EnginePhase phase = frontend.RunTurns(engine, eventBus);
    frontend.Info(std::string{"Game over: "} + game::gameplay::EnginePhaseName(phase) + ".");
    return true;
}
} // namespace engine::core
