#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace relcheck {

struct Config {
    std::string token;
    std::string message;
    std::string user_agent;
    bool auto_notify;

    static Config defaults();
    static Config load(const std::string& path);
    void save(const std::string& path) const;

    static std::string getConfigPath();
    static void ensureConfigDirectory(const std::string& path);
};

void to_json(nlohmann::json& j, const Config& config);
void from_json(const nlohmann::json& j, Config& config);

} // namespace relcheck
