#include "ui/ConsoleFrontend.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "game/gameplay/GameSession.hpp"

namespace ui
{
namespace
{
using game::gameplay::ActionChoice;
using game::gameplay::ActionKind;
using game::gameplay::ActionOption;
using game::gameplay::EnginePhase;
using game::gameplay::GameEvent;
using game::gameplay::GameEventType;
using game::gameplay::SubmitStatus;
using game::gameplay::TurnReport;
using game::maps::Direction;

constexpr Direction kDirections[]{Direction::Up, Direction::Down, Direction::Left, Direction::Right};
} // namespace

std::string Trim(const std::string& text)
{
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

std::string ToLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::optional<std::size_t> ParseMenuIndex(const std::string& text, std::size_t optionCount)
{
    const std::string trimmed = Trim(text);
    if (trimmed.empty())
    {
        return std::nullopt;
    }

    long long value = 0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    if (value < 1 || static_cast<unsigned long long>(value) > optionCount)
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value - 1);
}

ConsoleFrontend::ConsoleFrontend(std::istream& in, std::ostream& out)
    : m_in(&in)
    , m_out(&out)
{
}

std::optional<std::string> ConsoleFrontend::ReadLine()
{
    std::string line;
    if (!std::getline(*m_in, line))
    {
        return std::nullopt;
    }
    return Trim(line);
}

void ConsoleFrontend::Info(const std::string& line)
{
    *m_out << line << "\n";
}

std::optional<std::string> ConsoleFrontend::PromptLogin()
{
    while (true)
    {
        *m_out << "Enter your login: ";
        std::optional<std::string> line = ReadLine();
        if (!line.has_value())
        {
            return std::nullopt;
        }
        if (!line->empty())
        {
            return line;
        }
        Info("A login is required.");
    }
}

std::optional<bool> ConsoleFrontend::PromptYesNo(const std::string& question)
{
    while (true)
    {
        *m_out << question << " (yes/no): ";
        const std::optional<std::string> line = ReadLine();
        if (!line.has_value())
        {
            return std::nullopt;
        }
        const std::string answer = ToLower(*line);
        if (answer == "yes")
        {
            return true;
        }
        if (answer == "no")
        {
            return false;
        }
        Info("Invalid input. Please answer \"yes\" or \"no\".");
    }
}

DirectionPrompt ConsoleFrontend::PromptDirection()
{
    DirectionPrompt result;
    while (true)
    {
        Info("Choose a direction:");
        for (std::size_t i = 0; i < std::size(kDirections); ++i)
        {
            *m_out << (i + 1) << ". " << game::maps::GridMap::DirectionName(kDirections[i]) << "\n";
        }
        *m_out << "Enter a direction number or \"NO\" to cancel: ";

        const std::optional<std::string> line = ReadLine();
        if (!line.has_value())
        {
            result.endOfInput = true;
            return result;
        }
        if (ToLower(*line) == "no")
        {
            return result;
        }
        const std::optional<std::size_t> index = ParseMenuIndex(*line, std::size(kDirections));
        if (index.has_value())
        {
            result.direction = kDirections[*index];
            return result;
        }
        Info("Invalid input. Enter a direction number or \"NO\".");
    }
}

bool ConsoleFrontend::SetupRoster(game::gameplay::GameSession& session)
{
    std::size_t heroCount = 0;
    while (true)
    {
        *m_out << "Enter the number of heroes (1-" << session.MaxHeroes() << "): ";
        const std::optional<std::string> line = ReadLine();
        if (!line.has_value())
        {
            return false;
        }
        const std::optional<std::size_t> index = ParseMenuIndex(*line, static_cast<std::size_t>(session.MaxHeroes()));
        if (index.has_value())
        {
            heroCount = *index + 1;
            break;
        }
        Info("Enter a whole number between 1 and " + std::to_string(session.MaxHeroes()) + ".");
    }

    for (std::size_t i = 0; i < heroCount; ++i)
    {
        while (true)
        {
            *m_out << "Enter the name of hero " << (i + 1) << ": ";
            const std::optional<std::string> name = ReadLine();
            if (!name.has_value())
            {
                return false;
            }
            const game::gameplay::RosterError error = session.AddHero(*name);
            if (error == game::gameplay::RosterError::None)
            {
                break;
            }
            Info(std::string{"Invalid name: "} + game::gameplay::RosterErrorText(error) + ".");
        }
    }
    return true;
}

void ConsoleFrontend::AttachEventLog(game::gameplay::GameEventBus& eventBus, const game::gameplay::GameSession& session)
{
    const game::gameplay::GameSession* sessionPtr = &session;
    eventBus.SubscribeAll([this](const GameEvent& event) {
        *m_out << "[Game] " << game::gameplay::DescribeEvent(event) << "\n";
    });
    eventBus.Subscribe(GameEventType::RoundStarted, [this, sessionPtr](const GameEvent&) {
        PrintRoundSummary(*sessionPtr);
    });
}

void ConsoleFrontend::PrintRoundSummary(const game::gameplay::GameSession& session)
{
    for (const game::gameplay::Hero& hero : session.Heroes())
    {
        *m_out << "[Game] " << hero.Name() << " has " << hero.Health() << " health";
        if (hero.HasKey())
        {
            *m_out << " and carries the key";
        }
        *m_out << "\n";
    }
}

EnginePhase ConsoleFrontend::RunTurns(game::gameplay::TurnEngine& engine, game::gameplay::GameEventBus& eventBus)
{
    eventBus.DispatchQueued();

    while (!engine.IsFinished())
    {
        const game::gameplay::Hero* hero = engine.ActiveHero();
        const std::vector<ActionOption> options = engine.AvailableActions();
        if (hero == nullptr || options.empty())
        {
            break;
        }

        *m_out << "Choose an action for hero " << hero->Name() << " (health " << hero->Health() << "):\n";
        for (std::size_t i = 0; i < options.size(); ++i)
        {
            *m_out << (i + 1) << ". " << options[i].label << "\n";
        }
        *m_out << "Enter an action number: ";

        const std::optional<std::string> line = ReadLine();
        if (!line.has_value())
        {
            engine.Submit(ActionChoice{ActionKind::Quit, {}, Direction::Up});
            break;
        }

        const std::optional<std::size_t> index = ParseMenuIndex(*line, options.size());
        if (!index.has_value())
        {
            Info("Invalid input. Enter the number of an action.");
            continue;
        }

        const ActionOption& option = options[*index];
        ActionChoice choice{option.kind, option.target, Direction::Up};
        if (option.kind == ActionKind::Move)
        {
            const DirectionPrompt prompt = PromptDirection();
            if (prompt.endOfInput)
            {
                engine.Submit(ActionChoice{ActionKind::Quit, {}, Direction::Up});
                break;
            }
            if (!prompt.direction.has_value())
            {
                Info("No direction chosen. A turn cannot be skipped.");
                continue;
            }
            choice.direction = *prompt.direction;
        }

        TurnReport report = engine.Submit(choice);
        while (report.status == SubmitStatus::RetreatConfirmationRequired)
        {
            eventBus.DispatchQueued();
            const std::optional<bool> confirmed = PromptYesNo("Turning back is deadly. Are you sure? Your hero will die");
            if (!confirmed.has_value())
            {
                engine.ConfirmRetreat(false);
                engine.Submit(ActionChoice{ActionKind::Quit, {}, Direction::Up});
                break;
            }
            report = engine.ConfirmRetreat(*confirmed);
        }

        eventBus.DispatchQueued();
        if (report.status == SubmitStatus::NotApplicable || report.status == SubmitStatus::RetreatDeclined)
        {
            Info("A turn cannot be skipped.");
        }
    }

    eventBus.DispatchQueued();
    return engine.Phase();
}
} // namespace ui
