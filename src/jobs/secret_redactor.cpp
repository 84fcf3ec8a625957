#include "jobs/secret_redactor.hpp"

#include <algorithm>
#include <regex>

#include "nlohmann/json.hpp"

namespace playrun::jobs {
namespace {

const std::regex& SensitiveKeyPattern() {
    static const std::regex pattern("API|TOKEN|KEY|SECRET|PASS", std::regex::icase);
    return pattern;
}

const std::regex& UrlPasswordPattern() {
    static const std::regex pattern("^.*?://[^:/@]+:.*?@.*$");
    return pattern;
}

// Body of the JSON string literal for value, as written by json::dump().
std::string JsonEscaped(const std::string& value) {
    const auto quoted = nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return quoted.substr(1, quoted.size() - 2);
}

// Body of a single-quoted POSIX shell word, as written by utils::ShellQuote.
std::string ShellEscaped(const std::string& value) {
    return utils::ReplaceAll(value, "'", "'\"'\"'");
}

}  // namespace

// Also tracks the JSON-escaped and shell-quoted forms the value takes inside argv.
void SecretRedactor::AddSecret(const std::string& value) {
    if (value.empty()) {
        return;
    }
    secrets_.insert(value);
    const auto json = JsonEscaped(value);
    secrets_.insert(json);
    secrets_.insert(ShellEscaped(value));
    secrets_.insert(ShellEscaped(json));
    secrets_.insert(JsonEscaped(ShellEscaped(value)));
}

void SecretRedactor::AddSecrets(const std::set<std::string>& values) {
    for (const auto& value : values) {
        AddSecret(value);
    }
}

std::string SecretRedactor::Redact(const std::string& text) const {
    std::vector<std::string> ordered(secrets_.begin(), secrets_.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
    std::string out = text;
    for (const auto& secret : ordered) {
        out = utils::ReplaceAll(out, secret, kHiddenPassword);
    }
    return out;
}

std::vector<std::string> SecretRedactor::RedactArgs(const std::vector<std::string>& args) const {
    std::vector<std::string> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        out.push_back(Redact(arg));
    }
    return out;
}

bool SecretRedactor::IsSensitiveKey(const std::string& key) {
    if (key == "REST_API_URL" || key == "AWS_ACCESS_KEY" || key == "AWS_ACCESS_KEY_ID") {
        return false;
    }
    if (utils::StartsWith(key, "ANSIBLE_") && !utils::StartsWith(key, "ANSIBLE_NET")) {
        return false;
    }
    return std::regex_search(key, SensitiveKeyPattern());
}

utils::EnvMap SecretRedactor::RedactEnv(const utils::EnvMap& env) const {
    utils::EnvMap safe;
    for (const auto& [key, value] : env) {
        if (IsSensitiveKey(key) || std::regex_match(value, UrlPasswordPattern())) {
            safe[key] = kHiddenPassword;
            continue;
        }
        safe[key] = Redact(value);
    }
    return safe;
}

std::string SecretRedactor::ApplyReplacements(std::string text, const OutputReplacements& replacements) {
    for (const auto& [before, after] : replacements) {
        text = utils::ReplaceAll(text, before, after);
    }
    return text;
}

}  // namespace playrun::jobs
