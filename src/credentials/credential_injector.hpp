#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "credentials/credential.hpp"
#include "credentials/field_encryption.hpp"
#include "jobs/job_types.hpp"
#include "jobs/private_data_dir.hpp"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace playrun::credentials {

// Everything injection produces for one run.
struct InjectionContext {
    utils::EnvMap env;
    nlohmann::json extra_vars = nlohmann::json::object();
    jobs::PasswordPromptMap passwords;
    // Plaintext values the redactor must hide.
    std::set<std::string> secrets;
    // Key file to load through ssh-agent before the real command starts.
    std::string ssh_key_path;
};

struct MachineIdentity {
    std::string username = "root";
    std::string become_method;
    std::string become_username;
};

struct ScmIdentity {
    std::string username;
    std::string password;
};

const std::vector<std::string>& ReservedEnvNames();
bool IsReservedEnvName(const std::string& name);

class CredentialInjector {
public:
    CredentialInjector(const FieldCipher& cipher, jobs::PrivateDataDir& private_data, InjectionContext& context);

    // Machine role of a job; prompts are registered even without a credential.
    MachineIdentity InjectMachine(const Credential* credential,
                                  const std::map<std::string, std::string>& launch_passwords);
    // Source-control role of a project update.
    ScmIdentity InjectScm(const Credential* credential,
                          const std::map<std::string, std::string>& launch_passwords);
    void InjectCloud(const Credential& credential);
    void InjectNetwork(const Credential& credential);
    // Credential of an inventory update, keyed by its source.
    void InjectInventorySource(const Credential* credential, const jobs::InventoryUpdateOptions& options);
    void InjectCustom(const Credential& credential);

    // Decrypted input value; secret values are tracked for redaction.
    std::string Value(const Credential& credential, const std::string& field);

private:
    void AddPassword(const std::string& key, const std::string& value, bool secret = true);
    std::string WriteKeyFile(const Credential& credential, const std::string& prefix);

    void InjectAws(const Credential& credential);
    void InjectGce(const Credential& credential);
    void InjectAzure(const Credential& credential);
    void InjectAzureRm(const Credential& credential);
    void InjectOpenstack(const Credential& credential, const nlohmann::json& source_vars, bool inventory_form);

    void InjectEc2Source(const Credential* credential, const jobs::InventoryUpdateOptions& options);
    void InjectVmwareSource(const Credential* credential, const jobs::InventoryUpdateOptions& options);
    void InjectSatellite6Source(const Credential* credential, const jobs::InventoryUpdateOptions& options);
    void InjectCloudformsSource(const Credential* credential, const jobs::InventoryUpdateOptions& options);

    const FieldCipher& cipher_;
    jobs::PrivateDataDir& private_data_;
    InjectionContext& context_;
};

}  // namespace playrun::credentials
