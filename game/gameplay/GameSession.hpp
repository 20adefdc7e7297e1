#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "game/gameplay/Hero.hpp"
#include "game/gameplay/SessionSnapshot.hpp"
#include "game/maps/Labyrinth.hpp"

namespace game::gameplay
{
enum class RosterError
{
    None,
    RosterFull,
    EmptyName,
    DuplicateName
};

[[nodiscard]] const char* RosterErrorText(RosterError error);

struct Elimination
{
    std::string heroName;
    bool droppedKey = false;
    maps::GridCoord cell{0, 0};
    bool turnWrapped = false;
};

class GameSession
{
public:
    static constexpr int kMaxHeroes = 5;

    explicit GameSession(std::string playerLogin, int maxHeroes = kMaxHeroes);

    /// Rebuilds a session from a save. Returns nullopt when the snapshot is inconsistent.
    [[nodiscard]] static std::optional<GameSession> FromSnapshot(
        std::string playerLogin,
        const SessionSnapshot& snapshot,
        int maxHeroes = kMaxHeroes
    );
    [[nodiscard]] SessionSnapshot ToSnapshot() const;

    RosterError AddHero(const std::string& name);
    [[nodiscard]] RosterError ValidateHeroName(const std::string& name) const;

    [[nodiscard]] const std::string& PlayerLogin() const { return m_playerLogin; }
    [[nodiscard]] int MaxHeroes() const { return m_maxHeroes; }
    [[nodiscard]] int Round() const { return m_round; }
    [[nodiscard]] std::size_t TurnIndex() const { return m_turnIndex; }

    [[nodiscard]] maps::Labyrinth& Labyrinth() { return m_labyrinth; }
    [[nodiscard]] const maps::Labyrinth& Labyrinth() const { return m_labyrinth; }

    [[nodiscard]] std::vector<Hero>& Heroes() { return m_heroes; }
    [[nodiscard]] const std::vector<Hero>& Heroes() const { return m_heroes; }
    [[nodiscard]] bool RosterEmpty() const { return m_heroes.empty(); }

    [[nodiscard]] Hero* ActiveHero();
    [[nodiscard]] const Hero* ActiveHero() const;

    [[nodiscard]] std::vector<std::size_t> CoLocatedHeroes(std::size_t index) const;

    void BeginRound(std::vector<maps::GridCoord> hazards);

    bool AdvanceTurn();

    /// Removes a hero, drops its key where it stood, and keeps the turn index on the same
    /// active hero (or on the hero that follows a removed active hero).
    Elimination EliminateHero(std::size_t index);

private:
    std::string m_playerLogin;
    int m_maxHeroes = kMaxHeroes;
    int m_round = 0;
    std::size_t m_turnIndex = 0;
    maps::Labyrinth m_labyrinth;
    std::vector<Hero> m_heroes;
};
} // namespace game::gameplay
