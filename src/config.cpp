#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

namespace relcheck {

Config Config::defaults() {
    return Config{"", "", DEFAULT_USER_AGENT, true};
}

std::string Config::getConfigPath() {
    const char* home = getenv("HOME");
    if (!home) {
        throw ConfigError("Could not determine home directory");
    }

    return (fs::path(home) / ".relcheck" / "config.json").string();
}

void Config::ensureConfigDirectory(const std::string& path) {
    fs::path config_dir = fs::path(path).parent_path();
    if (!config_dir.empty() && !fs::exists(config_dir)) {
        fs::create_directories(config_dir);
    }
}

Config Config::load(const std::string& path) {
    ensureConfigDirectory(path);

    std::ifstream file(path);
    if (!file.is_open()) {
        Config default_config = defaults();
        default_config.save(path);
        return default_config;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
}

void Config::save(const std::string& path) const {
    ensureConfigDirectory(path);

    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not write config file " + path);
    }
    file << nlohmann::json(*this).dump(4);
}

void to_json(nlohmann::json& j, const Config& config) {
    j["token"] = config.token;
    j["message"] = config.message;
    j["user_agent"] = config.user_agent;
    j["auto_notify"] = config.auto_notify;
}

// Keys missing from the file keep their default values.
void from_json(const nlohmann::json& j, Config& config) {
    Config fallback = Config::defaults();
    config.token = j.value("token", fallback.token);
    config.message = j.value("message", fallback.message);
    config.user_agent = j.value("user_agent", fallback.user_agent);
    config.auto_notify = j.value("auto_notify", fallback.auto_notify);
}

} // namespace relcheck
