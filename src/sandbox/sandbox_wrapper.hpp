#pragma once

#include <string>
#include <utility>
#include <vector>

#include "config/config_schema.hpp"
#include "jobs/private_data_dir.hpp"

namespace playrun::sandbox {

struct BindMount {
    std::string source;
    std::string target;
};

struct SandboxSpec {
    std::string command = "bwrap";
    bool unshare_network = false;
    std::vector<BindMount> binds;
    std::string cwd;
};

// bwrap --unshare-pid [--unshare-net] --dev-bind / / (--bind src dst)* --chdir cwd args...
std::vector<std::string> WrapArgs(const std::vector<std::string>& args, const SandboxSpec& spec);

// Hidden paths are covered by empty placeholders created inside the private data dir,
// then show paths (cwd, the private data dir and configured extras) are bound back.
SandboxSpec PlanSandbox(const config::SandboxConfig& config,
                        const std::string& cwd,
                        jobs::PrivateDataDir& private_data);

}  // namespace playrun::sandbox
