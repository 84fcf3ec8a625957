#pragma once

#include <map>
#include <string>
#include <vector>

namespace playrun::config {

struct PathsConfig {
    std::string private_data_root = "/tmp";
    std::string projects_root = "/var/lib/playrun/projects";
    std::string playbooks_dir = "/usr/share/playrun/playbooks";
    std::string inventory_scripts_dir = "/usr/share/playrun/inventory";
};

struct SandboxConfig {
    bool enabled = true;
    std::string command = "bwrap";
    bool unshare_network = false;
    std::vector<std::string> hide_paths = {
        "/etc/playrun",
        "/var/lib/playrun",
        "/var/log"
    };
    std::vector<std::string> show_paths;
};

struct RunnerConfig {
    int poll_interval_ms = 100;
    int termination_grace_s = 3;
    std::string playbook_command = "ansible-playbook";
    std::string inventory_import_command = "playrun-inventory-import";
};

struct EnvConfig {
    std::vector<std::string> passthrough = {"PATH", "HOME", "LANG", "LC_ALL", "USER"};
    std::map<std::string, std::string> ansible_settings;
};

struct SecurityConfig {
    std::string secret_key;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    PathsConfig paths;
    SandboxConfig sandbox;
    RunnerConfig runner;
    EnvConfig env;
    SecurityConfig security;
    LoggingConfig logging;
};

}  // namespace playrun::config
