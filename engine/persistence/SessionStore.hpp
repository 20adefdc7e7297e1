#pragma once

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "game/gameplay/SessionSnapshot.hpp"

namespace engine::persistence
{
class ISessionStore
{
public:
    virtual ~ISessionStore() = default;

    [[nodiscard]] virtual std::optional<game::gameplay::SessionSnapshot> Load(const std::string& login) const = 0;
    [[nodiscard]] virtual bool Contains(const std::string& login) const = 0;
    virtual bool Save(const std::string& login, const game::gameplay::SessionSnapshot& snapshot, std::string* outError = nullptr) = 0;
    virtual bool Remove(const std::string& login, std::string* outError = nullptr) = 0;
};

class JsonSessionStore final : public ISessionStore
{
public:
    explicit JsonSessionStore(std::string path = "game_save.json");

    [[nodiscard]] std::optional<game::gameplay::SessionSnapshot> Load(const std::string& login) const override;
    [[nodiscard]] bool Contains(const std::string& login) const override;
    bool Save(const std::string& login, const game::gameplay::SessionSnapshot& snapshot, std::string* outError = nullptr) override;
    bool Remove(const std::string& login, std::string* outError = nullptr) override;

private:
    [[nodiscard]] std::optional<nlohmann::json> ReadAll() const;
    bool WriteAll(const nlohmann::json& root, std::string* outError) const;

    std::string m_path;
};

[[nodiscard]] nlohmann::json SnapshotToJson(const game::gameplay::SessionSnapshot& snapshot);
[[nodiscard]] std::optional<game::gameplay::SessionSnapshot> SnapshotFromJson(const nlohmann::json& node);
} // namespace engine::persistence
