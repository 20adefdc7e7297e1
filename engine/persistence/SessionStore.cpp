#include "engine/persistence/SessionStore.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <utility>

#include <nlohmann/json.hpp>

namespace engine::persistence
{
namespace
{
using json = nlohmann::json;
using game::gameplay::HeroState;
using game::gameplay::SessionSnapshot;
using game::maps::GridCoord;

// Integers outside the int range are treated like any other malformed field.
std::optional<int> IntFromJson(const json& node)
{
    if (node.is_number_unsigned())
    {
        const std::uint64_t value = node.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    if (node.is_number_integer())
    {
        const std::int64_t value = node.get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
        {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    return std::nullopt;
}

json CellToJson(const GridCoord& cell)
{
    return json::array({cell.x, cell.y});
}

std::optional<GridCoord> CellFromJson(const json& node)
{
    if (!node.is_array() || node.size() != 2)
    {
        return std::nullopt;
    }
    const std::optional<int> x = IntFromJson(node[0]);
    const std::optional<int> y = IntFromJson(node[1]);
    if (!x.has_value() || !y.has_value())
    {
        return std::nullopt;
    }
    return GridCoord{*x, *y};
}

json CellsToJson(const std::vector<GridCoord>& cells)
{
    json out = json::array();
    for (const GridCoord& cell : cells)
    {
        out.push_back(CellToJson(cell));
    }
    return out;
}

std::optional<std::vector<GridCoord>> CellsFromJson(const json& node)
{
    if (!node.is_array())
    {
        return std::nullopt;
    }
    std::vector<GridCoord> cells;
    cells.reserve(node.size());
    for (const json& item : node)
    {
        const std::optional<GridCoord> cell = CellFromJson(item);
        if (!cell.has_value())
        {
            return std::nullopt;
        }
        cells.push_back(*cell);
    }
    return cells;
}

json HeroToJson(const HeroState& hero)
{
    return json{
        {"name", hero.name},
        {"health", hero.health},
        {"position", CellToJson(hero.position)},
        {"prev_position", CellToJson(hero.previousPosition)},
        {"has_key", hero.hasKey},
        {"count_heal", hero.remainingSelfHeals},
    };
}

std::optional<HeroState> HeroFromJson(const json& node)
{
    if (!node.is_object())
    {
        return std::nullopt;
    }
    if (!node.contains("name") || !node["name"].is_string() ||
        !node.contains("health") || !node.contains("count_heal") ||
        !node.contains("has_key") || !node["has_key"].is_boolean() ||
        !node.contains("position") || !node.contains("prev_position"))
    {
        return std::nullopt;
    }

    const std::optional<int> health = IntFromJson(node["health"]);
    const std::optional<int> selfHeals = IntFromJson(node["count_heal"]);
    const std::optional<GridCoord> position = CellFromJson(node["position"]);
    const std::optional<GridCoord> previous = CellFromJson(node["prev_position"]);
    if (!health.has_value() || !selfHeals.has_value() || !position.has_value() || !previous.has_value())
    {
        return std::nullopt;
    }

    HeroState hero;
    hero.name = node["name"].get<std::string>();
    hero.health = *health;
    hero.hasKey = node["has_key"].get<bool>();
    hero.remainingSelfHeals = *selfHeals;
    hero.position = *position;
    hero.previousPosition = *previous;
    return hero;
}

std::optional<GridCoord> GolemCellFromJson(const json& node)
{
    // Older saves wrapped the golem cell in a one-element array.
    if (node.is_array() && node.size() == 1)
    {
        return CellFromJson(node[0]);
    }
    return CellFromJson(node);
}
} // namespace

json SnapshotToJson(const SessionSnapshot& snapshot)
{
    json heroes = json::array();
    for (const HeroState& hero : snapshot.heroes)
    {
        heroes.push_back(HeroToJson(hero));
    }

    json labyrinth;
    labyrinth["grid"] = snapshot.labyrinth.grid;
    labyrinth["fire_coords"] = CellsToJson(snapshot.labyrinth.hazards);
    labyrinth["key_coord"] = CellToJson(snapshot.labyrinth.keyCell);
    labyrinth["golem_coord"] = CellToJson(snapshot.labyrinth.golemCell);
    labyrinth["key"] = snapshot.labyrinth.keyPresent;

    json root;
    root["round"] = snapshot.round;
    root["current_turn"] = snapshot.turnIndex;
    root["fire_cells"] = CellsToJson(snapshot.hazards);
    root["heroes"] = std::move(heroes);
    root["labyrinth"] = std::move(labyrinth);
    return root;
}

std::optional<SessionSnapshot> SnapshotFromJson(const json& node)
{
    if (!node.is_object())
    {
        return std::nullopt;
    }
    if (!node.contains("round") || !node.contains("current_turn") ||
        !node.contains("fire_cells") || !node.contains("heroes") || !node["heroes"].is_array() ||
        !node.contains("labyrinth") || !node["labyrinth"].is_object())
    {
        return std::nullopt;
    }

    const std::optional<int> round = IntFromJson(node["round"]);
    const std::optional<int> turnIndex = IntFromJson(node["current_turn"]);
    if (!round.has_value() || !turnIndex.has_value())
    {
        return std::nullopt;
    }

    SessionSnapshot snapshot;
    snapshot.round = *round;
    snapshot.turnIndex = *turnIndex;

    std::optional<std::vector<GridCoord>> hazards = CellsFromJson(node["fire_cells"]);
    if (!hazards.has_value())
    {
        return std::nullopt;
    }
    snapshot.hazards = std::move(*hazards);

    for (const json& heroNode : node["heroes"])
    {
        std::optional<HeroState> hero = HeroFromJson(heroNode);
        if (!hero.has_value())
        {
            return std::nullopt;
        }
        snapshot.heroes.push_back(std::move(*hero));
    }

    const json& labyrinth = node["labyrinth"];
    if (!labyrinth.contains("grid") || !labyrinth["grid"].is_array() ||
        !labyrinth.contains("key") || !labyrinth["key"].is_boolean() ||
        !labyrinth.contains("key_coord") || !labyrinth.contains("golem_coord"))
    {
        return std::nullopt;
    }

    for (const json& row : labyrinth["grid"])
    {
        if (!row.is_array())
        {
            return std::nullopt;
        }
        std::vector<int>& codes = snapshot.labyrinth.grid.emplace_back();
        for (const json& code : row)
        {
            const std::optional<int> value = IntFromJson(code);
            if (!value.has_value())
            {
                return std::nullopt;
            }
            codes.push_back(*value);
        }
    }

    if (labyrinth.contains("fire_coords"))
    {
        std::optional<std::vector<GridCoord>> overlay = CellsFromJson(labyrinth["fire_coords"]);
        if (!overlay.has_value())
        {
            return std::nullopt;
        }
        snapshot.labyrinth.hazards = std::move(*overlay);
    }

    const std::optional<GridCoord> keyCell = CellFromJson(labyrinth["key_coord"]);
    const std::optional<GridCoord> golemCell = GolemCellFromJson(labyrinth["golem_coord"]);
    if (!keyCell.has_value() || !golemCell.has_value())
    {
        return std::nullopt;
    }
    snapshot.labyrinth.keyCell = *keyCell;
    snapshot.labyrinth.golemCell = *golemCell;
    snapshot.labyrinth.keyPresent = labyrinth["key"].get<bool>();
    return snapshot;
}

JsonSessionStore::JsonSessionStore(std::string path)
    : m_path(std::move(path))
{
}

std::optional<json> JsonSessionStore::ReadAll() const
{
    std::ifstream stream(m_path);
    if (!stream.is_open())
    {
        return std::nullopt;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[SaveStore] " << m_path << " is empty or corrupt: " << ex.what() << "\n";
        return std::nullopt;
    }

    if (!root.is_object())
    {
        std::cerr << "[SaveStore] " << m_path << " does not hold a save table\n";
        return std::nullopt;
    }
    return root;
}

bool JsonSessionStore::WriteAll(const json& root, std::string* outError) const
{
    const std::filesystem::path filePath(m_path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    std::ofstream stream(m_path, std::ios::trunc);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write save file: " + m_path;
        }
        return false;
    }

    stream << root.dump(4) << "\n";
    if (!stream.good())
    {
        if (outError != nullptr)
        {
            *outError = "Failed while writing save file: " + m_path;
        }
        return false;
    }
    return true;
}

std::optional<SessionSnapshot> JsonSessionStore::Load(const std::string& login) const
{
    const std::optional<json> root = ReadAll();
    if (!root.has_value() || !root->contains(login))
    {
        return std::nullopt;
    }

    std::optional<SessionSnapshot> snapshot = SnapshotFromJson((*root)[login]);
    if (!snapshot.has_value())
    {
        std::cerr << "[SaveStore] Save for '" << login << "' is malformed, ignoring it\n";
    }
    return snapshot;
}

bool JsonSessionStore::Contains(const std::string& login) const
{
    const std::optional<json> root = ReadAll();
    return root.has_value() && root->contains(login);
}

bool JsonSessionStore::Save(const std::string& login, const SessionSnapshot& snapshot, std::string* outError)
{
    json root = ReadAll().value_or(json::object());
    root[login] = SnapshotToJson(snapshot);
    return WriteAll(root, outError);
}

bool JsonSessionStore::Remove(const std::string& login, std::string* outError)
{
    std::optional<json> root = ReadAll();
    if (!root.has_value() || !root->contains(login))
    {
        return true;
    }
    root->erase(login);
    return WriteAll(*root, outError);
}
} // namespace engine::persistence
