#pragma once

#include <string>

namespace playrun::credentials {

// Secret inputs are stored as "$encrypted$AES$<base64>"; the AES-128 key is
// SHA1(secret_key + credential id + field name) truncated to 16 bytes.
class FieldCipher {
public:
    explicit FieldCipher(std::string secret_key);

    std::string Encrypt(int credential_id, const std::string& field, const std::string& plaintext) const;
    // Values without the encrypted prefix are returned unchanged.
    std::string Decrypt(int credential_id, const std::string& field, const std::string& value) const;

    static bool IsEncrypted(const std::string& value);

private:
    std::string DeriveKey(int credential_id, const std::string& field) const;

    std::string secret_key_;
};

}  // namespace playrun::credentials
