#pragma once

#include "credentials/credential.hpp"
#include "nlohmann/json.hpp"

namespace playrun::credentials {

// Accepts a built-in namespace string ("aws") or a full type object with
// "inputs": {"fields": [...]} and "injectors": {"env", "file": {"template"}, "extra_vars"}.
CredentialType CredentialTypeFromJson(const nlohmann::json& data);
Credential CredentialFromJson(const nlohmann::json& data);

nlohmann::json CredentialTypeToJson(const CredentialType& type);

}  // namespace playrun::credentials
