#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace playrun::credentials {

enum class CredentialKind {
    kSsh,
    kVault,
    kNet,
    kScm,
    kCloud,
    kInsights
};

// Built-in types have fixed injection behavior; kCustom goes through the template injector.
enum class BuiltinType {
    kCustom,
    kSsh,
    kScm,
    kNet,
    kAws,
    kRackspace,
    kGce,
    kAzure,
    kAzureRm,
    kVmware,
    kOpenstack,
    kSatellite6,
    kCloudforms
};

std::string KindToString(CredentialKind kind);
CredentialKind KindFromString(const std::string& value);

struct FieldDefinition {
    std::string id;
    std::string label;
    std::string type = "string";
    bool secret = false;
};

struct InjectorSpec {
    std::map<std::string, std::string> env;
    std::optional<std::string> file_template;
    std::map<std::string, std::string> extra_vars;
};

struct CredentialType {
    std::string name;
    CredentialKind kind = CredentialKind::kCloud;
    std::string namespace_id;
    BuiltinType builtin = BuiltinType::kCustom;
    bool managed = false;
    std::vector<FieldDefinition> fields;
    InjectorSpec injectors;

    const FieldDefinition* FindField(const std::string& id) const;
    bool IsSecret(const std::string& id) const;

    static CredentialType Builtin(const std::string& namespace_id);
    static std::vector<std::string> BuiltinNamespaces();
};

struct Credential {
    int id = 0;
    std::string name;
    CredentialType credential_type;
    nlohmann::json inputs = nlohmann::json::object();

    bool Has(const std::string& field) const;
    // Raw stored value; secret fields may still be encrypted.
    std::string Input(const std::string& field) const;
    bool Flag(const std::string& field) const;
};

}  // namespace playrun::credentials
