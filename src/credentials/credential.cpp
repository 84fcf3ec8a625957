#include "credentials/credential.hpp"

#include <utility>

#include "utils/errors.hpp"

namespace playrun::credentials {
namespace {

FieldDefinition Field(std::string id, std::string label, bool secret = false, std::string type = "string") {
    FieldDefinition field{};
    field.id = std::move(id);
    field.label = std::move(label);
    field.type = std::move(type);
    field.secret = secret;
    return field;
}

CredentialType MakeBuiltin(std::string namespace_id,
                           std::string name,
                           CredentialKind kind,
                           BuiltinType builtin,
                           std::vector<FieldDefinition> fields) {
    CredentialType type{};
    type.namespace_id = std::move(namespace_id);
    type.name = std::move(name);
    type.kind = kind;
    type.builtin = builtin;
    type.managed = true;
    type.fields = std::move(fields);
    return type;
}

}  // namespace

std::string KindToString(CredentialKind kind) {
    switch (kind) {
        case CredentialKind::kSsh:
            return "ssh";
        case CredentialKind::kVault:
            return "vault";
        case CredentialKind::kNet:
            return "net";
        case CredentialKind::kScm:
            return "scm";
        case CredentialKind::kCloud:
            return "cloud";
        case CredentialKind::kInsights:
            return "insights";
    }
    return "cloud";
}

CredentialKind KindFromString(const std::string& value) {
    if (value == "ssh") {
        return CredentialKind::kSsh;
    }
    if (value == "vault") {
        return CredentialKind::kVault;
    }
    if (value == "net") {
        return CredentialKind::kNet;
    }
    if (value == "scm") {
        return CredentialKind::kScm;
    }
    if (value == "insights") {
        return CredentialKind::kInsights;
    }
    return CredentialKind::kCloud;
}

const FieldDefinition* CredentialType::FindField(const std::string& id) const {
    for (const auto& field : fields) {
        if (field.id == id) {
            return &field;
        }
    }
    return nullptr;
}

bool CredentialType::IsSecret(const std::string& id) const {
    const auto* field = FindField(id);
    return field != nullptr && field->secret;
}

CredentialType CredentialType::Builtin(const std::string& namespace_id) {
    if (namespace_id == "ssh") {
        return MakeBuiltin("ssh", "Machine", CredentialKind::kSsh, BuiltinType::kSsh, {
            Field("username", "Username"),
            Field("password", "Password", true),
            Field("ssh_key_data", "SSH Private Key", true),
            Field("ssh_key_unlock", "Private Key Passphrase", true),
            Field("become_method", "Privilege Escalation Method"),
            Field("become_username", "Privilege Escalation Username"),
            Field("become_password", "Privilege Escalation Password", true),
            Field("vault_password", "Vault Password", true),
        });
    }
    if (namespace_id == "scm") {
        return MakeBuiltin("scm", "Source Control", CredentialKind::kScm, BuiltinType::kScm, {
            Field("username", "Username"),
            Field("password", "Password", true),
            Field("ssh_key_data", "SCM Private Key", true),
            Field("ssh_key_unlock", "Private Key Passphrase", true),
        });
    }
    if (namespace_id == "net") {
        return MakeBuiltin("net", "Network", CredentialKind::kNet, BuiltinType::kNet, {
            Field("username", "Username"),
            Field("password", "Password", true),
            Field("ssh_key_data", "SSH Private Key", true),
            Field("ssh_key_unlock", "Private Key Passphrase", true),
            Field("authorize", "Authorize", false, "boolean"),
            Field("authorize_password", "Authorize Password", true),
        });
    }
    if (namespace_id == "aws") {
        return MakeBuiltin("aws", "Amazon Web Services", CredentialKind::kCloud, BuiltinType::kAws, {
            Field("username", "Access Key"),
            Field("password", "Secret Key", true),
            Field("security_token", "STS Token", true),
        });
    }
    if (namespace_id == "rackspace") {
        return MakeBuiltin("rackspace", "Rackspace", CredentialKind::kCloud, BuiltinType::kRackspace, {
            Field("username", "Username"),
            Field("password", "Password", true),
        });
    }
    if (namespace_id == "gce") {
        return MakeBuiltin("gce", "Google Compute Engine", CredentialKind::kCloud, BuiltinType::kGce, {
            Field("username", "Service Account Email Address"),
            Field("project", "Project"),
            Field("ssh_key_data", "RSA Private Key", true),
        });
    }
    if (namespace_id == "azure") {
        return MakeBuiltin("azure", "Microsoft Azure Classic", CredentialKind::kCloud, BuiltinType::kAzure, {
            Field("username", "Subscription ID"),
            Field("ssh_key_data", "Management Certificate", true),
        });
    }
    if (namespace_id == "azure_rm") {
        return MakeBuiltin("azure_rm", "Microsoft Azure Resource Manager", CredentialKind::kCloud,
                           BuiltinType::kAzureRm, {
            Field("subscription", "Subscription ID"),
            Field("username", "Username"),
            Field("password", "Password", true),
            Field("client", "Client ID"),
            Field("secret", "Client Secret", true),
            Field("tenant", "Tenant ID"),
        });
    }
    if (namespace_id == "vmware") {
        return MakeBuiltin("vmware", "VMware vCenter", CredentialKind::kCloud, BuiltinType::kVmware, {
            Field("host", "VCenter Host"),
            Field("username", "Username"),
            Field("password", "Password", true),
        });
    }
    if (namespace_id == "openstack") {
        return MakeBuiltin("openstack", "OpenStack", CredentialKind::kCloud, BuiltinType::kOpenstack, {
            Field("username", "Username"),
            Field("password", "Password (API Key)", true),
            Field("host", "Host (Authentication URL)"),
            Field("project", "Project (Tenant Name)"),
            Field("domain", "Domain Name"),
        });
    }
    if (namespace_id == "satellite6") {
        return MakeBuiltin("satellite6", "Red Hat Satellite 6", CredentialKind::kCloud,
                           BuiltinType::kSatellite6, {
            Field("host", "Satellite 6 URL"),
            Field("username", "Username"),
            Field("password", "Password", true),
        });
    }
    if (namespace_id == "cloudforms") {
        return MakeBuiltin("cloudforms", "Red Hat CloudForms", CredentialKind::kCloud,
                           BuiltinType::kCloudforms, {
            Field("host", "CloudForms URL"),
            Field("username", "Username"),
            Field("password", "Password", true),
        });
    }
    throw InjectorError("unknown built-in credential type '" + namespace_id + "'");
}

std::vector<std::string> CredentialType::BuiltinNamespaces() {
    return {
        "ssh", "scm", "net", "aws", "rackspace", "gce", "azure", "azure_rm",
        "vmware", "openstack", "satellite6", "cloudforms"
    };
}

bool Credential::Has(const std::string& field) const {
    if (!inputs.is_object() || !inputs.contains(field)) {
        return false;
    }
    const auto& value = inputs[field];
    if (value.is_null()) {
        return false;
    }
    if (value.is_string()) {
        return !value.get<std::string>().empty();
    }
    return true;
}

std::string Credential::Input(const std::string& field) const {
    if (!Has(field)) {
        return {};
    }
    const auto& value = inputs[field];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "True" : "False";
    }
    return value.dump();
}

bool Credential::Flag(const std::string& field) const {
    if (!Has(field)) {
        return false;
    }
    const auto& value = inputs[field];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (!value.is_string()) {
        return false;
    }
    const auto text = value.get<std::string>();
    return text == "1" || text == "true" || text == "True";
}

}  // namespace playrun::credentials
