#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace playrun::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("PLAYRUN_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".playrun" / "config.json";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("paths") && data["paths"].is_object()) {
        const auto& paths = data["paths"];
        ReadString(paths, "privateDataRoot", config.paths.private_data_root);
        ReadString(paths, "projectsRoot", config.paths.projects_root);
        ReadString(paths, "playbooksDir", config.paths.playbooks_dir);
        ReadString(paths, "inventoryScriptsDir", config.paths.inventory_scripts_dir);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadBool(sandbox, "enabled", config.sandbox.enabled);
        ReadString(sandbox, "command", config.sandbox.command);
        ReadBool(sandbox, "unshareNetwork", config.sandbox.unshare_network);
        ReadStringList(sandbox, "hidePaths", config.sandbox.hide_paths);
        ReadStringList(sandbox, "showPaths", config.sandbox.show_paths);
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        const auto& runner = data["runner"];
        ReadInt(runner, "pollIntervalMs", config.runner.poll_interval_ms);
        ReadInt(runner, "terminationGraceS", config.runner.termination_grace_s);
        ReadString(runner, "playbookCommand", config.runner.playbook_command);
        ReadString(runner, "inventoryImportCommand", config.runner.inventory_import_command);
    }

    if (data.contains("env") && data["env"].is_object()) {
        const auto& env = data["env"];
        ReadStringList(env, "passthrough", config.env.passthrough);
        if (env.contains("ansibleSettings") && env["ansibleSettings"].is_object()) {
            for (const auto& [key, value] : env["ansibleSettings"].items()) {
                if (value.is_string()) {
                    config.env.ansible_settings[key] = value.get<std::string>();
                } else if (value.is_boolean()) {
                    config.env.ansible_settings[key] = value.get<bool>() ? "True" : "False";
                } else if (value.is_number()) {
                    config.env.ansible_settings[key] = value.dump();
                }
            }
        }
    }

    if (data.contains("security") && data["security"].is_object()) {
        ReadString(data["security"], "secretKey", config.security.secret_key);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto private_data_root = GetEnv("PLAYRUN_PATHS__PRIVATE_DATA_ROOT");
    if (!private_data_root.empty()) {
        config.paths.private_data_root = private_data_root;
    }

    const auto projects_root = GetEnv("PLAYRUN_PATHS__PROJECTS_ROOT");
    if (!projects_root.empty()) {
        config.paths.projects_root = projects_root;
    }

    const auto playbooks_dir = GetEnv("PLAYRUN_PATHS__PLAYBOOKS_DIR");
    if (!playbooks_dir.empty()) {
        config.paths.playbooks_dir = playbooks_dir;
    }

    const auto scripts_dir = GetEnv("PLAYRUN_PATHS__INVENTORY_SCRIPTS_DIR");
    if (!scripts_dir.empty()) {
        config.paths.inventory_scripts_dir = scripts_dir;
    }

    const auto sandbox_enabled = GetEnv("PLAYRUN_SANDBOX__ENABLED");
    if (!sandbox_enabled.empty()) {
        config.sandbox.enabled = utils::ParseBool(sandbox_enabled);
    }

    const auto sandbox_command = GetEnv("PLAYRUN_SANDBOX__COMMAND");
    if (!sandbox_command.empty()) {
        config.sandbox.command = sandbox_command;
    }

    const auto unshare_network = GetEnv("PLAYRUN_SANDBOX__UNSHARE_NETWORK");
    if (!unshare_network.empty()) {
        config.sandbox.unshare_network = utils::ParseBool(unshare_network);
    }

    const auto show_paths = GetEnv("PLAYRUN_SANDBOX__SHOW_PATHS");
    if (!show_paths.empty()) {
        config.sandbox.show_paths = utils::SplitCsv(show_paths);
    }

    const auto hide_paths = GetEnv("PLAYRUN_SANDBOX__HIDE_PATHS");
    if (!hide_paths.empty()) {
        config.sandbox.hide_paths = utils::SplitCsv(hide_paths);
    }

    const auto poll_interval = GetEnv("PLAYRUN_RUNNER__POLL_INTERVAL_MS");
    if (!poll_interval.empty()) {
        config.runner.poll_interval_ms = ParseInt(poll_interval, config.runner.poll_interval_ms);
    }

    const auto grace = GetEnv("PLAYRUN_RUNNER__TERMINATION_GRACE_S");
    if (!grace.empty()) {
        config.runner.termination_grace_s = ParseInt(grace, config.runner.termination_grace_s);
    }

    const auto secret_key = GetEnv("PLAYRUN_SECURITY__SECRET_KEY");
    if (!secret_key.empty()) {
        config.security.secret_key = secret_key;
    }

    const auto log_level = GetEnv("PLAYRUN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    if (!std::filesystem::exists(path)) {
        return config;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("config", "ignoring unreadable config " + path.string() + ": " + ex.what());
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyConfigFromEnv(config);
    return config;
}

}  // namespace playrun::config
