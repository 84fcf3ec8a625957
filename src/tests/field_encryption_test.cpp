#include <gtest/gtest.h>

#include "credentials/field_encryption.hpp"
#include "utils/errors.hpp"

namespace playrun::credentials {
namespace {

TEST(FieldCipherTest, EncryptedValuesCarryPrefixAndDecryptBack) {
    const FieldCipher cipher("secret-key");
    const auto encrypted = cipher.Encrypt(42, "password", "hunter2");
    EXPECT_EQ(encrypted.rfind("$encrypted$AES$", 0), 0u);
    EXPECT_TRUE(FieldCipher::IsEncrypted(encrypted));
    EXPECT_EQ(encrypted.find("hunter2"), std::string::npos);
    EXPECT_EQ(cipher.Decrypt(42, "password", encrypted), "hunter2");
}

TEST(FieldCipherTest, KeyDependsOnCredentialAndField) {
    const FieldCipher cipher("secret-key");
    const auto encrypted = cipher.Encrypt(42, "password", "same value");
    EXPECT_NE(encrypted, cipher.Encrypt(43, "password", "same value"));
    EXPECT_NE(encrypted, cipher.Encrypt(42, "become_password", "same value"));
    EXPECT_NE(encrypted, FieldCipher("other-key").Encrypt(42, "password", "same value"));
}

TEST(FieldCipherTest, BlockSizedPlaintextSurvives) {
    const FieldCipher cipher("secret-key");
    const std::string sixteen = "0123456789abcdef";
    EXPECT_EQ(cipher.Decrypt(1, "secret", cipher.Encrypt(1, "secret", sixteen)), sixteen);
    const std::string multiline = "-----BEGIN KEY-----\nAAAA\n-----END KEY-----\n";
    EXPECT_EQ(cipher.Decrypt(1, "ssh_key_data", cipher.Encrypt(1, "ssh_key_data", multiline)), multiline);
}

TEST(FieldCipherTest, PlainValuesPassThrough) {
    const FieldCipher cipher("secret-key");
    EXPECT_FALSE(FieldCipher::IsEncrypted("ASK"));
    EXPECT_EQ(cipher.Decrypt(1, "password", "ASK"), "ASK");
    EXPECT_EQ(cipher.Decrypt(1, "password", ""), "");
}

TEST(FieldCipherTest, MalformedCiphertextIsRejected) {
    const FieldCipher cipher("secret-key");
    EXPECT_THROW(cipher.Decrypt(1, "password", "$encrypted$"), InjectorError);
    EXPECT_THROW(cipher.Decrypt(1, "password", "$encrypted$DES$AAAAAAAAAAAAAAAAAAAAAA=="), InjectorError);
    EXPECT_THROW(cipher.Decrypt(1, "password", "$encrypted$AES$abc"), InjectorError);
    EXPECT_THROW(cipher.Decrypt(1, "password", "$encrypted$AES$YWJj"), InjectorError);
}

}  // namespace
}  // namespace playrun::credentials
