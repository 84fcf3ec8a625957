#include "credentials/field_encryption.hpp"

#include <memory>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace playrun::credentials {
namespace {

constexpr const char* kEncryptedPrefix = "$encrypted$";
constexpr std::size_t kBlockSize = 16;

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string OpenSslError(const std::string& what) {
    const auto err = ::ERR_get_error();
    if (err == 0) {
        return what;
    }
    char buffer[256];
    ::ERR_error_string_n(err, buffer, sizeof(buffer));
    return what + ": " + buffer;
}

std::string Base64Encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = ::EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string Base64Decode(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        throw InjectorError("encrypted field has malformed base64 payload");
    }
    std::string out(3 * (text.size() / 4), '\0');
    const int written = ::EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (written < 0) {
        throw InjectorError("encrypted field has malformed base64 payload");
    }
    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        ++padding;
    }
    if (text[text.size() - 2] == '=') {
        ++padding;
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string RunEcb(const std::string& key, const std::string& input, bool encrypt) {
    CipherCtx ctx(::EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw InjectorError(OpenSslError("EVP_CIPHER_CTX_new failed"));
    }
    const auto* key_bytes = reinterpret_cast<const unsigned char*>(key.data());
    if (::EVP_CipherInit_ex(ctx.get(), ::EVP_aes_128_ecb(), nullptr, key_bytes, nullptr, encrypt ? 1 : 0) != 1) {
        throw InjectorError(OpenSslError("AES initialisation failed"));
    }
    ::EVP_CIPHER_CTX_set_padding(ctx.get(), 0);
    std::vector<unsigned char> out(input.size() + kBlockSize);
    int out_len = 0;
    if (::EVP_CipherUpdate(ctx.get(), out.data(), &out_len,
                           reinterpret_cast<const unsigned char*>(input.data()),
                           static_cast<int>(input.size())) != 1) {
        throw InjectorError(OpenSslError("AES update failed"));
    }
    int final_len = 0;
    if (::EVP_CipherFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        throw InjectorError(OpenSslError("AES finalisation failed"));
    }
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(out_len + final_len));
}

}  // namespace

FieldCipher::FieldCipher(std::string secret_key)
    : secret_key_(std::move(secret_key)) {}

bool FieldCipher::IsEncrypted(const std::string& value) {
    return utils::StartsWith(value, kEncryptedPrefix);
}

std::string FieldCipher::DeriveKey(int credential_id, const std::string& field) const {
    const auto material = secret_key_ + std::to_string(credential_id) + field;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (::EVP_Digest(material.data(), material.size(), digest, &digest_len, ::EVP_sha1(), nullptr) != 1) {
        throw InjectorError(OpenSslError("SHA1 digest failed"));
    }
    return std::string(reinterpret_cast<const char*>(digest), kBlockSize);
}

std::string FieldCipher::Encrypt(int credential_id, const std::string& field, const std::string& plaintext) const {
    std::string padded = plaintext;
    while (padded.empty() || padded.size() % kBlockSize != 0) {
        padded.push_back('\0');
    }
    const auto encrypted = RunEcb(DeriveKey(credential_id, field), padded, true);
    return std::string(kEncryptedPrefix) + "AES$" + Base64Encode(encrypted);
}

std::string FieldCipher::Decrypt(int credential_id, const std::string& field, const std::string& value) const {
    if (!IsEncrypted(value)) {
        return value;
    }
    const auto rest = value.substr(std::string(kEncryptedPrefix).size());
    const auto sep = rest.find('$');
    if (sep == std::string::npos) {
        throw InjectorError("field '" + field + "' has a malformed encrypted value");
    }
    const auto algorithm = rest.substr(0, sep);
    if (algorithm != "AES") {
        throw InjectorError("field '" + field + "' uses unsupported cipher " + algorithm);
    }
    const auto ciphertext = Base64Decode(rest.substr(sep + 1));
    if (ciphertext.size() % kBlockSize != 0) {
        throw InjectorError("field '" + field + "' ciphertext is not block aligned");
    }
    auto plaintext = RunEcb(DeriveKey(credential_id, field), ciphertext, false);
    const auto end = plaintext.find_last_not_of('\0');
    plaintext.erase(end == std::string::npos ? 0 : end + 1);
    return plaintext;
}

}  // namespace playrun::credentials
