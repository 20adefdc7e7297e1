#include "game/gameplay/GameEvents.hpp"

#include <sstream>

namespace game::gameplay
{
const char* EventTypeName(GameEventType type)
{
    switch (type)
    {
        case GameEventType::RoundStarted: return "round_started";
        case GameEventType::TurnStarted: return "turn_started";
        case GameEventType::HeroMoved: return "hero_moved";
        case GameEventType::HeroCollided: return "hero_collided";
        case GameEventType::HeroCaughtFire: return "hero_caught_fire";
        case GameEventType::HeroSlainByGolem: return "hero_slain_by_golem";
        case GameEventType::HeroRetreatDeath: return "hero_retreat_death";
        case GameEventType::RetreatDeclined: return "retreat_declined";
        case GameEventType::HeroAttacked: return "hero_attacked";
        case GameEventType::KeyPickedUp: return "key_picked_up";
        case GameEventType::HealedAtStation: return "healed_at_station";
        case GameEventType::SelfHealed: return "self_healed";
        case GameEventType::HealRefused: return "heal_refused";
        case GameEventType::HeroEliminated: return "hero_eliminated";
        case GameEventType::KeyDropped: return "key_dropped";
        case GameEventType::GameSaved: return "game_saved";
        case GameEventType::SaveFailed: return "save_failed";
        case GameEventType::Victory: return "victory";
        case GameEventType::AllHeroesDead: return "all_heroes_dead";
        case GameEventType::Quit: return "quit";
        default: return "unknown";
    }
}

std::string FormatCell(const maps::GridCoord& cell)
{
    return "(" + std::to_string(cell.x) + ", " + std::to_string(cell.y) + ")";
}

std::string DescribeEvent(const GameEvent& event)
{
    std::ostringstream out;
    switch (event.type)
    {
        case GameEventType::RoundStarted:
        {
            out << "Round " << event.value << " started. Fire cells:";
            for (const maps::GridCoord& cell : event.cells)
            {
                out << ' ' << FormatCell(cell);
            }
            break;
        }
        case GameEventType::TurnStarted:
            out << "Hero " << event.hero << " to act, health " << event.value;
            break;
        case GameEventType::HeroMoved:
            out << "Hero " << event.hero << " moved to " << FormatCell(event.cell);
            break;
        case GameEventType::HeroCollided:
            out << "Hero " << event.hero << " ran into a wall and lost one health";
            break;
        case GameEventType::HeroCaughtFire:
            out << "Hero " << event.hero << " stepped into fire at " << FormatCell(event.cell) << " and lost one health";
            break;
        case GameEventType::HeroSlainByGolem:
            out << "Hero " << event.hero << " met the golem without the key and was struck down";
            break;
        case GameEventType::HeroRetreatDeath:
            out << "Hero " << event.hero << " turned back in fear and perished";
            break;
        case GameEventType::RetreatDeclined:
            out << "Hero " << event.hero << " stayed put";
            break;
        case GameEventType::HeroAttacked:
            out << "Hero " << event.hero << " struck " << event.target << " with a sword, " << event.target
                << " has " << event.value << " health left";
            break;
        case GameEventType::KeyPickedUp:
            out << "Hero " << event.hero << " picked up the key";
            break;
        case GameEventType::HealedAtStation:
            out << "Hero " << event.hero << " restored health at the heart";
            break;
        case GameEventType::SelfHealed:
            out << "Hero " << event.hero << " used a medkit, health now " << event.value;
            break;
        case GameEventType::HealRefused:
            out << "Hero " << event.hero << " cannot heal right now";
            break;
        case GameEventType::HeroEliminated:
            out << "Hero " << event.hero << " has fallen";
            break;
        case GameEventType::KeyDropped:
            out << "The key fell from " << event.hero << " at " << FormatCell(event.cell);
            break;
        case GameEventType::GameSaved:
            out << "Game saved";
            break;
        case GameEventType::SaveFailed:
            out << "Game could not be saved";
            break;
        case GameEventType::Victory:
            out << "Hero " << event.hero << " handed the key to the golem and won the game";
            break;
        case GameEventType::AllHeroesDead:
            out << "All heroes are dead, nobody won";
            break;
        case GameEventType::Quit:
            out << "Game ended by the player";
            break;
        default:
            out << EventTypeName(event.type);
            break;
    }
    return out.str();
}
} // namespace game::gameplay
