#include "credentials/credential_injector.hpp"

#include <algorithm>
#include <initializer_list>

#include "credentials/template_engine.hpp"
#include "utils/config_files.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace playrun::credentials {
namespace {

const std::vector<std::string>& EscalationMethods() {
    static const std::vector<std::string> kMethods = {
        "sudo", "su", "pbrun", "pfexec", "dzdo", "pmrun", "runas"
    };
    return kMethods;
}

std::string LaunchValueOr(const std::map<std::string, std::string>& overrides,
                          const std::string& key,
                          const std::string& fallback) {
    const auto it = overrides.find(key);
    if (it != overrides.end()) {
        return it->second;
    }
    return fallback;
}

bool UsablePassword(const std::string& value) {
    return !value.empty() && value != "ASK";
}

void RequireBuiltin(const Credential& credential, std::initializer_list<BuiltinType> allowed,
                    const std::string& role) {
    const auto builtin = credential.credential_type.builtin;
    if (std::find(allowed.begin(), allowed.end(), builtin) == allowed.end()) {
        throw InjectorError("credential '" + credential.name + "' of type '" +
                            credential.credential_type.name + "' cannot be used as " + role + " credential");
    }
}

void OverlaySourceVars(utils::IniDocument& ini, const std::string& section, const nlohmann::json& source_vars) {
    if (!source_vars.is_object()) {
        return;
    }
    for (auto it = source_vars.begin(); it != source_vars.end(); ++it) {
        ini.Set(section, it.key(), utils::ScalarToString(it.value()));
    }
}

std::string NormalizeRegions(const std::string& regions) {
    std::vector<std::string> cleaned;
    for (const auto& region : utils::SplitCsv(regions)) {
        const auto trimmed = utils::Trim(region);
        if (!trimmed.empty()) {
            cleaned.push_back(trimmed);
        }
    }
    return cleaned.empty() ? "all" : utils::Join(cleaned, ",");
}

}  // namespace

const std::vector<std::string>& ReservedEnvNames() {
    static const std::vector<std::string> kReserved = {
        "JOB_ID",
        "INVENTORY_ID",
        "INVENTORY_SOURCE_ID",
        "INVENTORY_UPDATE_ID",
        "PROJECT_UPDATE_ID",
        "PATH",
        "PYTHONPATH",
        "VIRTUAL_ENV",
        "REST_API_URL",
        "REST_API_TOKEN",
        "CALLBACK_CONNECTION",
        "CALLBACK_QUEUE",
        "PROOT_TMP_DIR"
    };
    return kReserved;
}

bool IsReservedEnvName(const std::string& name) {
    if (utils::StartsWith(name, "ANSIBLE_")) {
        return true;
    }
    const auto& reserved = ReservedEnvNames();
    return std::find(reserved.begin(), reserved.end(), name) != reserved.end();
}

CredentialInjector::CredentialInjector(const FieldCipher& cipher,
                                       jobs::PrivateDataDir& private_data,
                                       InjectionContext& context)
    : cipher_(cipher), private_data_(private_data), context_(context) {}

std::string CredentialInjector::Value(const Credential& credential, const std::string& field) {
    const auto raw = credential.Input(field);
    const auto value = cipher_.Decrypt(credential.id, field, raw);
    if ((credential.credential_type.IsSecret(field) || FieldCipher::IsEncrypted(raw)) && UsablePassword(value)) {
        context_.secrets.insert(value);
    }
    return value;
}

void CredentialInjector::AddPassword(const std::string& key, const std::string& value, bool secret) {
    if (!UsablePassword(value)) {
        return;
    }
    context_.passwords.values[key] = value;
    if (secret) {
        context_.secrets.insert(value);
    }
}

std::string CredentialInjector::WriteKeyFile(const Credential& credential, const std::string& prefix) {
    return private_data_.WriteTempSecret(prefix, Value(credential, "ssh_key_data"));
}

MachineIdentity CredentialInjector::InjectMachine(const Credential* credential,
                                                  const std::map<std::string, std::string>& launch_passwords) {
    auto& prompts = context_.passwords;
    prompts.AddPrompt("Enter passphrase for .*:", "ssh_key_unlock");
    prompts.AddPrompt("Bad passphrase, try again for .*:", "");
    for (const auto& method : EscalationMethods()) {
        prompts.AddPrompt(method + " password.*:", "become_password");
        prompts.AddPrompt(utils::ToUpper(method) + " password.*:", "become_password");
    }
    prompts.AddPrompt("BECOME password.*:", "become_password");
    prompts.AddPrompt("SSH password:", "ssh_password");
    prompts.AddPrompt("Password:", "ssh_password");
    prompts.AddPrompt("Vault password:", "vault_password");

    MachineIdentity identity{};
    if (credential == nullptr) {
        return identity;
    }
    RequireBuiltin(*credential, {BuiltinType::kSsh}, "machine");

    AddPassword("ssh_password", LaunchValueOr(launch_passwords, "ssh_password", Value(*credential, "password")));
    for (const char* field : {"become_password", "ssh_key_unlock", "vault_password"}) {
        AddPassword(field, LaunchValueOr(launch_passwords, field, Value(*credential, field)));
    }

    const auto username = credential->Input("username");
    if (!username.empty()) {
        identity.username = username;
    }
    identity.become_method = credential->Input("become_method");
    identity.become_username = credential->Input("become_username");

    if (credential->Has("ssh_key_data")) {
        context_.ssh_key_path = private_data_.WriteSecret("credential", Value(*credential, "ssh_key_data"));
    }
    return identity;
}

ScmIdentity CredentialInjector::InjectScm(const Credential* credential,
                                          const std::map<std::string, std::string>& launch_passwords) {
    auto& prompts = context_.passwords;
    prompts.AddPrompt("Username for.*:", "scm_username");
    prompts.AddPrompt("Password for.*:", "scm_password");
    prompts.AddPrompt("Password:", "scm_password");
    prompts.AddPrompt("\\S+?@\\S+?'s\\s+?password:", "scm_password");
    prompts.AddPrompt("Enter passphrase for .*:", "scm_key_unlock");
    prompts.AddPrompt("Bad passphrase, try again for .*:", "");

    ScmIdentity identity{};
    if (credential == nullptr) {
        return identity;
    }
    RequireBuiltin(*credential, {BuiltinType::kSsh, BuiltinType::kScm}, "source control");

    identity.username = LaunchValueOr(launch_passwords, "scm_username", credential->Input("username"));
    identity.password = LaunchValueOr(launch_passwords, "scm_password", Value(*credential, "password"));
    AddPassword("scm_username", identity.username, false);
    AddPassword("scm_password", identity.password);
    AddPassword("scm_key_unlock", LaunchValueOr(launch_passwords, "scm_key_unlock",
                                                Value(*credential, "ssh_key_unlock")));
    if (!UsablePassword(identity.password)) {
        identity.password.clear();
    }

    if (credential->Has("ssh_key_data")) {
        context_.ssh_key_path = private_data_.WriteSecret("scm_credential", Value(*credential, "ssh_key_data"));
    }
    return identity;
}

void CredentialInjector::InjectAws(const Credential& credential) {
    context_.env["AWS_ACCESS_KEY"] = credential.Input("username");
    context_.env["AWS_SECRET_KEY"] = Value(credential, "password");
    if (credential.Has("security_token")) {
        context_.env["AWS_SECURITY_TOKEN"] = Value(credential, "security_token");
    }
}

void CredentialInjector::InjectGce(const Credential& credential) {
    context_.env["GCE_EMAIL"] = credential.Input("username");
    context_.env["GCE_PROJECT"] = credential.Input("project");
    context_.env["GCE_PEM_FILE_PATH"] = WriteKeyFile(credential, "gce_credential_");
}

void CredentialInjector::InjectAzure(const Credential& credential) {
    context_.env["AZURE_SUBSCRIPTION_ID"] = credential.Input("username");
    context_.env["AZURE_CERT_PATH"] = WriteKeyFile(credential, "azure_credential_");
}

void CredentialInjector::InjectAzureRm(const Credential& credential) {
    if (credential.Has("client") && credential.Has("tenant")) {
        context_.env["AZURE_CLIENT_ID"] = credential.Input("client");
        context_.env["AZURE_SECRET"] = Value(credential, "secret");
        context_.env["AZURE_TENANT"] = credential.Input("tenant");
        context_.env["AZURE_SUBSCRIPTION_ID"] = credential.Input("subscription");
        return;
    }
    context_.env["AZURE_SUBSCRIPTION_ID"] = credential.Input("subscription");
    context_.env["AZURE_AD_USER"] = credential.Input("username");
    context_.env["AZURE_PASSWORD"] = Value(credential, "password");
}

void CredentialInjector::InjectOpenstack(const Credential& credential,
                                         const nlohmann::json& source_vars,
                                         bool inventory_form) {
    nlohmann::json auth = {
        {"auth_url", credential.Input("host")},
        {"username", credential.Input("username")},
        {"password", Value(credential, "password")},
        {"project_name", credential.Input("project")}
    };
    if (credential.Has("domain")) {
        auth["domain_name"] = credential.Input("domain");
    }
    nlohmann::json devstack = {{"auth", auth}};
    if (inventory_form) {
        bool is_private = true;
        if (source_vars.is_object() && source_vars.contains("private") && source_vars["private"].is_boolean()) {
            is_private = source_vars["private"].get<bool>();
        }
        devstack["private"] = is_private;
    }
    const nlohmann::json document = {{"clouds", {{"devstack", devstack}}}};
    context_.env["OS_CLIENT_CONFIG_FILE"] =
        private_data_.WriteTempSecret("openstack_credential_", utils::RenderYaml(document));
}

void CredentialInjector::InjectCloud(const Credential& credential) {
    switch (credential.credential_type.builtin) {
        case BuiltinType::kCustom:
            InjectCustom(credential);
            return;
        case BuiltinType::kAws:
            InjectAws(credential);
            return;
        case BuiltinType::kRackspace:
            context_.env["RAX_USERNAME"] = credential.Input("username");
            context_.env["RAX_API_KEY"] = Value(credential, "password");
            context_.env["CLOUD_VERIFY_SSL"] = "False";
            return;
        case BuiltinType::kGce:
            InjectGce(credential);
            return;
        case BuiltinType::kAzure:
            InjectAzure(credential);
            return;
        case BuiltinType::kAzureRm:
            InjectAzureRm(credential);
            return;
        case BuiltinType::kVmware:
            context_.env["VMWARE_USER"] = credential.Input("username");
            context_.env["VMWARE_PASSWORD"] = Value(credential, "password");
            context_.env["VMWARE_HOST"] = credential.Input("host");
            return;
        case BuiltinType::kOpenstack:
            InjectOpenstack(credential, nlohmann::json::object(), false);
            return;
        default:
            break;
    }
    RequireBuiltin(credential, {}, "cloud");
}

void CredentialInjector::InjectNetwork(const Credential& credential) {
    if (credential.credential_type.builtin == BuiltinType::kCustom) {
        InjectCustom(credential);
        return;
    }
    RequireBuiltin(credential, {BuiltinType::kNet}, "network");
    context_.env["ANSIBLE_NET_USERNAME"] = credential.Input("username");
    context_.env["ANSIBLE_NET_PASSWORD"] = Value(credential, "password");
    if (credential.Has("ssh_key_data")) {
        context_.env["ANSIBLE_NET_SSH_KEYFILE"] = WriteKeyFile(credential, "network_credential_");
    }
    if (credential.Flag("authorize")) {
        context_.env["ANSIBLE_NET_AUTHORIZE"] = "1";
        context_.env["ANSIBLE_NET_AUTH_PASS"] = Value(credential, "authorize_password");
    }
}

void CredentialInjector::InjectEc2Source(const Credential* credential, const jobs::InventoryUpdateOptions& options) {
    utils::IniDocument ini;
    const std::string section = "ec2";
    ini.Set(section, "regions", NormalizeRegions(options.source_regions));
    ini.Set(section, "regions_exclude", "us-gov-west-1,cn-north-1");
    ini.Set(section, "destination_variable", "public_dns_name");
    ini.Set(section, "vpc_destination_variable", "ip_address");
    ini.Set(section, "route53", "False");
    ini.Set(section, "all_instances", "True");
    ini.Set(section, "all_rds_instances", "False");
    ini.Set(section, "rds", "False");
    ini.Set(section, "nested_groups", "True");
    ini.Set(section, "elasticache", "False");
    ini.Set(section, "cache_path", private_data_.MakeScratchDir("ec2_cache_"));
    ini.Set(section, "cache_max_age", "300");
    OverlaySourceVars(ini, section, options.source_vars);
    context_.env["EC2_INI_PATH"] = private_data_.WriteTempSecret("ec2_", ini.Render());

    if (credential == nullptr) {
        return;
    }
    RequireBuiltin(*credential, {BuiltinType::kAws}, "ec2 inventory");
    context_.env["AWS_ACCESS_KEY_ID"] = credential->Input("username");
    context_.env["AWS_SECRET_ACCESS_KEY"] = Value(*credential, "password");
    if (credential->Has("security_token")) {
        context_.env["AWS_SECURITY_TOKEN"] = Value(*credential, "security_token");
    }
}

void CredentialInjector::InjectVmwareSource(const Credential* credential,
                                            const jobs::InventoryUpdateOptions& options) {
    utils::IniDocument ini;
    const std::string section = "vmware";
    ini.Set(section, "cache_max_age", "0");
    if (credential != nullptr) {
        RequireBuiltin(*credential, {BuiltinType::kVmware}, "vmware inventory");
        ini.Set(section, "username", credential->Input("username"));
        ini.Set(section, "password", Value(*credential, "password"));
        ini.Set(section, "server", credential->Input("host"));
    }
    OverlaySourceVars(ini, section, options.source_vars);
    context_.env["VMWARE_INI_PATH"] = private_data_.WriteTempSecret("vmware_", ini.Render());
}

void CredentialInjector::InjectSatellite6Source(const Credential* credential,
                                                const jobs::InventoryUpdateOptions& options) {
    utils::IniDocument ini;
    const std::string section = "foreman";
    ini.Set(section, "ssl_verify", "False");
    OverlaySourceVars(ini, section, options.source_vars);
    if (credential != nullptr) {
        RequireBuiltin(*credential, {BuiltinType::kSatellite6}, "satellite6 inventory");
        ini.Set(section, "url", credential->Input("host"));
        ini.Set(section, "user", credential->Input("username"));
        ini.Set(section, "password", Value(*credential, "password"));
    }
    ini.Set("ansible", "want_facts", "True");
    ini.Set("cache", "path", private_data_.MakeScratchDir("foreman_cache_"));
    ini.Set("cache", "max_age", "0");
    context_.env["FOREMAN_INI_PATH"] = private_data_.WriteTempSecret("foreman_", ini.Render());
}

void CredentialInjector::InjectCloudformsSource(const Credential* credential,
                                                const jobs::InventoryUpdateOptions& options) {
    utils::IniDocument ini;
    const std::string section = "cloudforms";
    if (credential != nullptr) {
        RequireBuiltin(*credential, {BuiltinType::kCloudforms}, "cloudforms inventory");
        ini.Set(section, "url", credential->Input("host"));
        ini.Set(section, "username", credential->Input("username"));
        ini.Set(section, "password", Value(*credential, "password"));
    }
    ini.Set(section, "ssl_verify", "false");
    if (options.source_vars.is_object()) {
        for (const char* option : {"version", "purge_actions", "clean_group_keys", "nest_tags", "suffix",
                                   "prefer_ipv4"}) {
            if (options.source_vars.contains(option)) {
                ini.Set(section, option, utils::ScalarToString(options.source_vars[option]));
            }
        }
    }
    ini.Set("cache", "max_age", "600");
    ini.Set("cache", "path", private_data_.MakeScratchDir("cloudforms_cache_"));
    context_.env["CLOUDFORMS_INI_PATH"] = private_data_.WriteTempSecret("cloudforms_", ini.Render());
}

void CredentialInjector::InjectInventorySource(const Credential* credential,
                                               const jobs::InventoryUpdateOptions& options) {
    if (credential != nullptr && credential->credential_type.builtin == BuiltinType::kCustom) {
        InjectCustom(*credential);
        return;
    }
    const auto& source = options.source;
    if (source == "ec2") {
        InjectEc2Source(credential, options);
        return;
    }
    if (source == "vmware") {
        InjectVmwareSource(credential, options);
        return;
    }
    if (source == "satellite6") {
        InjectSatellite6Source(credential, options);
        return;
    }
    if (source == "cloudforms") {
        InjectCloudformsSource(credential, options);
        return;
    }
    if (source != "azure" && source != "azure_rm" && source != "gce" && source != "openstack") {
        throw InjectorError("unsupported inventory source '" + source + "'");
    }
    if (credential == nullptr) {
        utils::LogWarn("injector", "inventory source " + source + " has no credential");
        return;
    }
    if (source == "azure") {
        RequireBuiltin(*credential, {BuiltinType::kAzure}, "azure inventory");
        InjectAzure(*credential);
    } else if (source == "azure_rm") {
        RequireBuiltin(*credential, {BuiltinType::kAzureRm}, "azure_rm inventory");
        InjectAzureRm(*credential);
    } else if (source == "gce") {
        RequireBuiltin(*credential, {BuiltinType::kGce}, "gce inventory");
        InjectGce(*credential);
        context_.env["GCE_ZONE"] = options.source_regions;
    } else {
        RequireBuiltin(*credential, {BuiltinType::kOpenstack}, "openstack inventory");
        InjectOpenstack(*credential, options.source_vars, true);
    }
}

void CredentialInjector::InjectCustom(const Credential& credential) {
    const auto& type = credential.credential_type;
    nlohmann::json context = nlohmann::json::object();
    std::set<std::string> secret_fields;
    if (credential.inputs.is_object()) {
        for (auto it = credential.inputs.begin(); it != credential.inputs.end(); ++it) {
            if (it.value().is_string()) {
                context[it.key()] = Value(credential, it.key());
            } else {
                context[it.key()] = it.value();
            }
            if (type.IsSecret(it.key())) {
                secret_fields.insert(it.key());
            }
        }
    }
    context["tower"] = nlohmann::json::object();

    const auto references_secret = [&secret_fields](const RenderResult& rendered) {
        return std::any_of(rendered.referenced.begin(), rendered.referenced.end(),
                           [&secret_fields](const std::string& name) { return secret_fields.count(name) > 0; });
    };

    const auto& injectors = type.injectors;
    if (injectors.file_template) {
        const auto rendered = RenderTemplate(*injectors.file_template, context);
        context["tower"]["filename"] = private_data_.WriteTempSecret("custom_credential_", rendered.text);
    }
    for (const auto& [name, source] : injectors.env) {
        if (IsReservedEnvName(name)) {
            utils::LogWarn("injector", "ignoring reserved environment variable " + name + " declared by " +
                                           type.name);
            continue;
        }
        const auto rendered = RenderTemplate(source, context);
        context_.env[name] = rendered.text;
        if (references_secret(rendered)) {
            context_.secrets.insert(rendered.text);
        }
    }
    for (const auto& [key, source] : injectors.extra_vars) {
        const auto rendered = RenderTemplate(source, context);
        context_.extra_vars[key] = rendered.text;
        if (references_secret(rendered)) {
            context_.secrets.insert(rendered.text);
        }
    }
}

}  // namespace playrun::credentials
