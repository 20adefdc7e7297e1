#pragma once

#include <string>

namespace engine::core
{
struct AppConfig
{
    int assetVersion = 1;
    std::string saveFile = "game_save.json";
    unsigned int hazardSeed = 0;
    int maxHeroes = 5;
    bool logEvents = true;
};

[[nodiscard]] bool LoadAppConfig(const std::string& path, AppConfig& outConfig, std::string* outStatus = nullptr);
[[nodiscard]] bool SaveAppConfig(const std::string& path, const AppConfig& config, std::string* outStatus = nullptr);
} // namespace engine::core
