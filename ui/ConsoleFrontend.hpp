#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "game/gameplay/GameEvents.hpp"
#include "game/gameplay/TurnEngine.hpp"
#include "game/maps/GridMap.hpp"

namespace game::gameplay
{
class GameSession;
}

namespace ui
{
struct DirectionPrompt
{
    bool endOfInput = false;
    std::optional<game::maps::Direction> direction;
};

class ConsoleFrontend
{
public:
    ConsoleFrontend(std::istream& in, std::ostream& out);

    [[nodiscard]] std::optional<std::string> ReadLine();

    [[nodiscard]] std::optional<std::string> PromptLogin();
    [[nodiscard]] std::optional<bool> PromptYesNo(const std::string& question);
    [[nodiscard]] DirectionPrompt PromptDirection();

    bool SetupRoster(game::gameplay::GameSession& session);

    void AttachEventLog(game::gameplay::GameEventBus& eventBus, const game::gameplay::GameSession& session);

    game::gameplay::EnginePhase RunTurns(game::gameplay::TurnEngine& engine, game::gameplay::GameEventBus& eventBus);

    void Info(const std::string& line);

private:
    void PrintRoundSummary(const game::gameplay::GameSession& session);

    std::istream* m_in = nullptr;
    std::ostream* m_out = nullptr;
};

[[nodiscard]] std::optional<std::size_t> ParseMenuIndex(const std::string& text, std::size_t optionCount);
[[nodiscard]] std::string Trim(const std::string& text);
[[nodiscard]] std::string ToLower(std::string text);
} // namespace ui
