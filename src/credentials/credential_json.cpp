#include "credentials/credential_json.hpp"

#include "utils/errors.hpp"

namespace playrun::credentials {
namespace {

std::string StringOr(const nlohmann::json& data, const char* key, const std::string& fallback = {}) {
    if (data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return fallback;
}

std::map<std::string, std::string> ReadTemplateMap(const nlohmann::json& data, const char* key) {
    std::map<std::string, std::string> out;
    if (!data.contains(key) || !data[key].is_object()) {
        return out;
    }
    for (const auto& [name, value] : data[key].items()) {
        if (!value.is_string()) {
            throw InjectorError(std::string("injector ") + key + "." + name + " must be a string template");
        }
        out[name] = value.get<std::string>();
    }
    return out;
}

}  // namespace

CredentialType CredentialTypeFromJson(const nlohmann::json& data) {
    if (data.is_string()) {
        return CredentialType::Builtin(data.get<std::string>());
    }
    if (!data.is_object()) {
        throw InjectorError("credential_type must be a string or an object");
    }
    const auto namespace_id = StringOr(data, "namespace");
    if (!namespace_id.empty()) {
        return CredentialType::Builtin(namespace_id);
    }

    CredentialType type{};
    type.name = StringOr(data, "name");
    type.kind = KindFromString(StringOr(data, "kind", "cloud"));
    type.managed = data.value("managed_by_tower", false);
    if (data.contains("inputs") && data["inputs"].is_object() && data["inputs"].contains("fields")) {
        for (const auto& item : data["inputs"]["fields"]) {
            FieldDefinition field{};
            field.id = StringOr(item, "id");
            if (field.id.empty()) {
                throw InjectorError("credential type '" + type.name + "' has a field without an id");
            }
            field.label = StringOr(item, "label", field.id);
            field.type = StringOr(item, "type", "string");
            field.secret = item.value("secret", false);
            type.fields.push_back(field);
        }
    }
    if (data.contains("injectors") && data["injectors"].is_object()) {
        const auto& injectors = data["injectors"];
        type.injectors.env = ReadTemplateMap(injectors, "env");
        type.injectors.extra_vars = ReadTemplateMap(injectors, "extra_vars");
        if (injectors.contains("file") && injectors["file"].is_object()) {
            const auto& file = injectors["file"];
            if (file.contains("template") && file["template"].is_string()) {
                type.injectors.file_template = file["template"].get<std::string>();
            }
        }
    }
    return type;
}

Credential CredentialFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw InjectorError("credential must be an object");
    }
    Credential credential{};
    credential.id = data.value("id", 0);
    credential.name = StringOr(data, "name");
    if (!data.contains("credential_type")) {
        throw InjectorError("credential '" + credential.name + "' has no credential_type");
    }
    credential.credential_type = CredentialTypeFromJson(data["credential_type"]);
    if (data.contains("inputs") && data["inputs"].is_object()) {
        credential.inputs = data["inputs"];
    }
    return credential;
}

nlohmann::json CredentialTypeToJson(const CredentialType& type) {
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& field : type.fields) {
        fields.push_back({
            {"id", field.id},
            {"label", field.label},
            {"type", field.type},
            {"secret", field.secret}
        });
    }
    return {
        {"name", type.name},
        {"kind", KindToString(type.kind)},
        {"namespace", type.namespace_id},
        {"managed_by_tower", type.managed},
        {"inputs", {{"fields", fields}}}
    };
}

}  // namespace playrun::credentials
