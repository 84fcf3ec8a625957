#pragma once

#include <set>
#include <string>
#include <vector>

#include "jobs/job_types.hpp"
#include "utils/common.hpp"

namespace playrun::jobs {

inline constexpr const char* kHiddenPassword = "**********";

class SecretRedactor {
public:
    void AddSecret(const std::string& value);
    void AddSecrets(const std::set<std::string>& values);

    const std::set<std::string>& Secrets() const { return secrets_; }

    // Replaces every occurrence of a tracked secret, longest first.
    std::string Redact(const std::string& text) const;
    std::vector<std::string> RedactArgs(const std::vector<std::string>& args) const;
    // Returns a copy; values are hidden by tracked secret, sensitive key name or url password.
    utils::EnvMap RedactEnv(const utils::EnvMap& env) const;

    static bool IsSensitiveKey(const std::string& key);
    static std::string ApplyReplacements(std::string text, const OutputReplacements& replacements);

private:
    std::set<std::string> secrets_;
};

}  // namespace playrun::jobs
