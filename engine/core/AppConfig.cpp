#include "engine/core/AppConfig.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

namespace engine::core
{
namespace
{
using json = nlohmann::json;

constexpr int kMinHeroes = 1;
constexpr int kMaxHeroes = 5;
} // namespace

bool LoadAppConfig(const std::string& path, AppConfig& outConfig, std::string* outStatus)
{
    outConfig = AppConfig{};

    if (!std::filesystem::exists(path))
    {
        return SaveAppConfig(path, outConfig, outStatus);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outStatus != nullptr)
        {
            *outStatus = "Failed to open game config: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        if (outStatus != nullptr)
        {
            *outStatus = "Invalid game config JSON. Using defaults.";
        }
        stream.close();
        return SaveAppConfig(path, outConfig, nullptr);
    }

    if (!root.is_object())
    {
        if (outStatus != nullptr)
        {
            *outStatus = "Game config is not a JSON object. Using defaults.";
        }
        stream.close();
        return SaveAppConfig(path, outConfig, nullptr);
    }

    // Values that do not fit the target type keep the default.
    auto readInt = [&](const char* key, int& target) {
        if (!root.contains(key) || !root[key].is_number_integer())
        {
            return;
        }
        if (root[key].is_number_unsigned())
        {
            const std::uint64_t value = root[key].get<std::uint64_t>();
            if (value <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            {
                target = static_cast<int>(value);
            }
            return;
        }
        const std::int64_t value = root[key].get<std::int64_t>();
        if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())
        {
            target = static_cast<int>(value);
        }
    };
    auto readBool = [&](const char* key, bool& target) {
        if (root.contains(key) && root[key].is_boolean())
        {
            target = root[key].get<bool>();
        }
    };
    auto readString = [&](const char* key, std::string& target) {
        if (root.contains(key) && root[key].is_string())
        {
            target = root[key].get<std::string>();
        }
    };

    readInt("asset_version", outConfig.assetVersion);
    readString("save_file", outConfig.saveFile);
    readInt("max_heroes", outConfig.maxHeroes);
    readBool("log_events", outConfig.logEvents);
    if (root.contains("hazard_seed") && root["hazard_seed"].is_number_unsigned())
    {
        const std::uint64_t seed = root["hazard_seed"].get<std::uint64_t>();
        if (seed <= std::numeric_limits<unsigned int>::max())
        {
            outConfig.hazardSeed = static_cast<unsigned int>(seed);
        }
    }

    outConfig.maxHeroes = std::clamp(outConfig.maxHeroes, kMinHeroes, kMaxHeroes);
    if (outConfig.saveFile.empty())
    {
        outConfig.saveFile = AppConfig{}.saveFile;
    }
    return true;
}

bool SaveAppConfig(const std::string& path, const AppConfig& config, std::string* outStatus)
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    json root;
    root["asset_version"] = config.assetVersion;
    root["save_file"] = config.saveFile;
    root["hazard_seed"] = config.hazardSeed;
    root["max_heroes"] = config.maxHeroes;
    root["log_events"] = config.logEvents;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outStatus != nullptr)
        {
            *outStatus = "Cannot write game config: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}
} // namespace engine::core
