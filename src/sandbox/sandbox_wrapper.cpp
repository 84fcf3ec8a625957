#include "sandbox/sandbox_wrapper.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include "utils/logging.hpp"

namespace playrun::sandbox {

std::vector<std::string> WrapArgs(const std::vector<std::string>& args, const SandboxSpec& spec) {
    std::vector<std::string> wrapped = {spec.command, "--unshare-pid"};
    if (spec.unshare_network) {
        wrapped.push_back("--unshare-net");
    }
    wrapped.insert(wrapped.end(), {"--dev-bind", "/", "/"});
    for (const auto& bind : spec.binds) {
        wrapped.insert(wrapped.end(), {"--bind", bind.source, bind.target});
    }
    if (!spec.cwd.empty()) {
        wrapped.insert(wrapped.end(), {"--chdir", spec.cwd});
    }
    wrapped.insert(wrapped.end(), args.begin(), args.end());
    return wrapped;
}

SandboxSpec PlanSandbox(const config::SandboxConfig& config,
                        const std::string& cwd,
                        jobs::PrivateDataDir& private_data) {
    SandboxSpec spec{};
    spec.command = config.command;
    spec.unshare_network = config.unshare_network;
    spec.cwd = cwd;

    for (const auto& hidden : config.hide_paths) {
        std::error_code ec;
        const auto status = std::filesystem::status(hidden, ec);
        if (ec || !std::filesystem::exists(status)) {
            continue;
        }
        const auto placeholder = std::filesystem::is_directory(status)
            ? private_data.MakeScratchDir("hidden_")
            : private_data.WriteTempSecret("hidden_", "");
        spec.binds.push_back(BindMount{placeholder, hidden});
    }

    std::vector<std::string> candidates = {cwd, private_data.Path()};
    candidates.insert(candidates.end(), config.show_paths.begin(), config.show_paths.end());
    std::set<std::string> shown;
    for (const auto& path : candidates) {
        if (path.empty()) {
            continue;
        }
        std::error_code ec;
        const auto resolved = std::filesystem::canonical(path, ec);
        if (ec) {
            utils::LogDebug("sandbox", "skipping missing show path " + path);
            continue;
        }
        shown.insert(resolved.string());
    }
    for (const auto& path : shown) {
        spec.binds.push_back(BindMount{path, path});
    }
    return spec;
}

}  // namespace playrun::sandbox
