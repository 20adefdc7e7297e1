/*
JSON save store tests.
*/
#include "engine/persistence/SessionStore.hpp"

#include <stdio.h>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

using engine::persistence::JsonSessionStore;
using engine::persistence::SnapshotFromJson;
using engine::persistence::SnapshotToJson;
using game::gameplay::HeroState;
using game::gameplay::SessionSnapshot;
using game::maps::GridCoord;
using game::maps::GridMap;
using json = nlohmann::json;

static std::string temp_path(const char* name)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "labyrinth_tests" / name;
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path.string();
}

static SessionSnapshot sample_snapshot()
{
    SessionSnapshot snapshot;
    snapshot.round = 3;
    snapshot.turnIndex = 1;
    snapshot.hazards = {GridCoord{3, 1}, GridCoord{0, 5}, GridCoord{2, 2}, GridCoord{3, 4}};

    HeroState a;
    a.name = "Ann";
    a.health = 2;
    a.position = GridCoord{2, 2};
    a.previousPosition = GridCoord{2, 1};
    a.remainingSelfHeals = 1;
    HeroState b;
    b.name = "Bo";
    b.hasKey = true;
    b.position = GridCoord{1, 2};
    b.previousPosition = GridCoord{2, 2};
    snapshot.heroes = {a, b};

    snapshot.labyrinth.grid = GridMap::Default().ToCodes();
    snapshot.labyrinth.hazards = snapshot.hazards;
    snapshot.labyrinth.keyPresent = false;
    return snapshot;
}

static int test_save_load_round_trip()
{
    JsonSessionStore store(temp_path("round_trip.json"));
    const SessionSnapshot snapshot = sample_snapshot();
    EXPECT(!store.Contains("ann"), "nothing saved yet");
    EXPECT(!store.Load("ann").has_value(), "no record");

    std::string error;
    EXPECT(store.Save("ann", snapshot, &error), "save succeeds");
    EXPECT(store.Contains("ann"), "record present");
    const std::optional<SessionSnapshot> loaded = store.Load("ann");
    EXPECT(loaded.has_value(), "record loads");
    EXPECT(*loaded == snapshot, "every field survives");
    return 0;
}

static int test_logins_are_independent()
{
    JsonSessionStore store(temp_path("two_logins.json"));
    SessionSnapshot first = sample_snapshot();
    SessionSnapshot second = sample_snapshot();
    second.round = 9;
    EXPECT(store.Save("ann", first), "save ann");
    EXPECT(store.Save("bob", second), "save bob");
    EXPECT(store.Load("ann")->round == 3, "ann kept");
    EXPECT(store.Load("bob")->round == 9, "bob kept");

    EXPECT(store.Remove("ann"), "remove ann");
    EXPECT(!store.Contains("ann"), "ann gone");
    EXPECT(store.Contains("bob"), "bob untouched");
    EXPECT(store.Remove("nobody"), "removing a missing record is fine");
    return 0;
}

static int test_file_layout()
{
    const std::string path = temp_path("layout.json");
    JsonSessionStore store(path);
    EXPECT(store.Save("ann", sample_snapshot()), "save");

    std::ifstream stream(path);
    json root;
    stream >> root;
    const json& record = root["ann"];
    EXPECT(record["round"] == 3, "round key");
    EXPECT(record["current_turn"] == 1, "current_turn key");
    EXPECT(record["fire_cells"].size() == 4u, "fire_cells key");
    EXPECT(record["heroes"][0]["name"] == "Ann", "hero name");
    EXPECT(record["heroes"][0]["count_heal"] == 1, "count_heal key");
    EXPECT(record["heroes"][1]["has_key"] == true, "has_key key");
    EXPECT(record["heroes"][0]["prev_position"] == json::array({2, 1}), "prev_position key");
    EXPECT(record["labyrinth"]["golem_coord"] == json::array({0, 7}), "golem_coord key");
    EXPECT(record["labyrinth"]["key"] == false, "key flag");
    EXPECT(record["labyrinth"]["grid"].size() == 4u, "grid rows");
    return 0;
}

static int test_corrupt_store_reads_as_empty()
{
    const std::string path = temp_path("corrupt.json");
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    {
        std::ofstream stream(path);
        stream << "{ this is not json";
    }
    JsonSessionStore store(path);
    EXPECT(!store.Contains("ann"), "corrupt store has no records");
    EXPECT(!store.Load("ann").has_value(), "corrupt store loads nothing");

    EXPECT(store.Save("ann", sample_snapshot()), "saving replaces the corrupt file");
    EXPECT(store.Load("ann").has_value(), "fresh record readable");

    const std::string emptyPath = temp_path("empty.json");
    {
        std::ofstream stream(emptyPath);
    }
    JsonSessionStore empty(emptyPath);
    EXPECT(!empty.Contains("ann"), "empty file has no records");
    return 0;
}

static int test_malformed_record_rejected()
{
    json node = SnapshotToJson(sample_snapshot());
    node["heroes"][0].erase("health");
    EXPECT(!SnapshotFromJson(node).has_value(), "missing hero health");

    json badCell = SnapshotToJson(sample_snapshot());
    badCell["fire_cells"][0] = json::array({1});
    EXPECT(!SnapshotFromJson(badCell).has_value(), "short coordinate");

    EXPECT(!SnapshotFromJson(json::array()).has_value(), "not an object");
    return 0;
}

static int test_wrapped_golem_cell_accepted()
{
    json node = SnapshotToJson(sample_snapshot());
    node["labyrinth"]["golem_coord"] = json::array({json::array({0, 7})});
    const std::optional<SessionSnapshot> snapshot = SnapshotFromJson(node);
    EXPECT(snapshot.has_value(), "wrapped golem cell loads");
    EXPECT(snapshot->labyrinth.golemCell == GridCoord(0, 7), "golem cell unwrapped");
    return 0;
}

static int test_out_of_range_integers_rejected()
{
    json turn = SnapshotToJson(sample_snapshot());
    turn["current_turn"] = 4294967296LL;
    EXPECT(!SnapshotFromJson(turn).has_value(), "turn index above int range");

    json round = SnapshotToJson(sample_snapshot());
    round["round"] = -4294967296LL;
    EXPECT(!SnapshotFromJson(round).has_value(), "round below int range");

    json health = SnapshotToJson(sample_snapshot());
    health["heroes"][0]["health"] = 18446744073709551615ULL;
    EXPECT(!SnapshotFromJson(health).has_value(), "health above int range");

    json cell = SnapshotToJson(sample_snapshot());
    cell["heroes"][1]["position"] = json::array({4294967297LL, 2});
    EXPECT(!SnapshotFromJson(cell).has_value(), "coordinate above int range");

    json code = SnapshotToJson(sample_snapshot());
    code["labyrinth"]["grid"][0][0] = 4294967297LL;
    EXPECT(!SnapshotFromJson(code).has_value(), "terrain code above int range");

    json largest = SnapshotToJson(sample_snapshot());
    largest["round"] = 2147483647LL;
    const std::optional<SessionSnapshot> kept = SnapshotFromJson(largest);
    EXPECT(kept.has_value() && kept->round == 2147483647, "largest int still reads");
    return 0;
}

int main(void)
{
    if (test_save_load_round_trip() != 0) return 1;
    if (test_logins_are_independent() != 0) return 1;
    if (test_file_layout() != 0) return 1;
    if (test_corrupt_store_reads_as_empty() != 0) return 1;
    if (test_malformed_record_rejected() != 0) return 1;
    if (test_wrapped_golem_cell_accepted() != 0) return 1;
    if (test_out_of_range_integers_rejected() != 0) return 1;
    return 0;
}
