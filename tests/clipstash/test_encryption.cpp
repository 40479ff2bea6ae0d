#include <gtest/gtest.h>
#include <clipstash/security/aes_gcm_encryption_service.hpp>

#include <filesystem>
#include <fstream>

using namespace clipstash;
namespace fs = std::filesystem;

class EncryptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "clipstash_encryption_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        key_file_ = test_dir_ / "history.key";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
    fs::path key_file_;
};

TEST_F(EncryptionTest, RoundTrip) {
    AesGcmEncryptionService service(key_file_);

    auto sealed = service.encrypt("clipboard secrets");
    ASSERT_TRUE(sealed.ok()) << sealed.error().to_string();
    EXPECT_EQ(sealed->compare(0, 4, "CSE1"), 0);
    EXPECT_EQ(sealed->size(), 4 + AesGcmEncryptionService::NONCE_SIZE +
                              AesGcmEncryptionService::TAG_SIZE + 17);

    auto opened = service.decrypt(*sealed);
    ASSERT_TRUE(opened.ok()) << opened.error().to_string();
    EXPECT_EQ(*opened, "clipboard secrets");
}

TEST_F(EncryptionTest, CreatesPrivateKeyFileOnFirstUse) {
    AesGcmEncryptionService service(key_file_);
    EXPECT_FALSE(fs::exists(key_file_));

    ASSERT_TRUE(service.encrypt("x").ok());
    ASSERT_TRUE(fs::exists(key_file_));
    EXPECT_EQ(fs::file_size(key_file_), AesGcmEncryptionService::KEY_SIZE);

    auto perms = fs::status(key_file_).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(EncryptionTest, NonceIsFreshPerMessage) {
    AesGcmEncryptionService service(key_file_);
    auto a = service.encrypt("same");
    auto b = service.encrypt("same");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(*a, *b);
}

TEST_F(EncryptionTest, KeyPersistsAcrossInstances) {
    std::string sealed;
    {
        AesGcmEncryptionService first(key_file_);
        auto result = first.encrypt("kept");
        ASSERT_TRUE(result.ok());
        sealed = *result;
    }

    AesGcmEncryptionService second(key_file_);
    auto opened = second.decrypt(sealed);
    ASSERT_TRUE(opened.ok()) << opened.error().to_string();
    EXPECT_EQ(*opened, "kept");
}

TEST_F(EncryptionTest, TamperingFailsAuthentication) {
    AesGcmEncryptionService service(key_file_);
    auto sealed = service.encrypt("do not touch");
    ASSERT_TRUE(sealed.ok());

    std::string tampered = *sealed;
    tampered.back() = static_cast<char>(tampered.back() ^ 0x01);

    auto opened = service.decrypt(tampered);
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error_code(), ErrorCode::DECRYPTION_FAILED);
}

TEST_F(EncryptionTest, WrongKeyFailsAuthentication) {
    AesGcmEncryptionService first(key_file_);
    auto sealed = first.encrypt("private");
    ASSERT_TRUE(sealed.ok());

    AesGcmEncryptionService other(test_dir_ / "other.key");
    auto opened = other.decrypt(*sealed);
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error_code(), ErrorCode::DECRYPTION_FAILED);
}

TEST_F(EncryptionTest, MalformedEnvelope) {
    AesGcmEncryptionService service(key_file_);
    EXPECT_EQ(service.decrypt("plain json").error_code(), ErrorCode::ENCRYPTED_PAYLOAD_INVALID);
    EXPECT_EQ(service.decrypt("CSE1short").error_code(), ErrorCode::ENCRYPTED_PAYLOAD_INVALID);
    EXPECT_EQ(service.decrypt("").error_code(), ErrorCode::ENCRYPTED_PAYLOAD_INVALID);
}

TEST_F(EncryptionTest, CorruptKeyFileIsUnavailable) {
    {
        std::ofstream out(key_file_, std::ios::binary);
        out << "too short";
    }
    AesGcmEncryptionService service(key_file_);
    auto sealed = service.encrypt("x");
    ASSERT_FALSE(sealed.ok());
    EXPECT_EQ(sealed.error_code(), ErrorCode::ENCRYPTION_KEY_UNAVAILABLE);
}
