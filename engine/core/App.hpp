#pragma once

#include <iosfwd>
#include <string>

#include "engine/core/AppConfig.hpp"

namespace engine::core
{
class App
{
public:
    explicit App(std::string configPath = "config/game.json");

    bool Run(std::istream& in, std::ostream& out);

    [[nodiscard]] const AppConfig& Config() const { return m_config; }

private:
    void LoadConfig();

    std::string m_configPath;
    AppConfig m_config;
};
} // namespace engine::core
