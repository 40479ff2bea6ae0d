#include <clipstash/security/aes_gcm_encryption_service.hpp>
#include <clipstash/util/serializer.hpp>
#include <clipstash/util/uuid.hpp>

#include <openssl/evp.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace clipstash {

namespace {

constexpr size_t MAGIC_SIZE = 4;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const unsigned char* as_bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

unsigned char* as_bytes(std::string& s) {
    return reinterpret_cast<unsigned char*>(&s[0]);
}

// Write the key with O_EXCL so concurrent first use never clobbers a key
Result<void> write_key_file(const std::filesystem::path& path, const uint8_t* key, size_t size) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                     "Cannot create key file " + path.string() + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, key + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                         std::string("Cannot write key file: ") + std::strerror(saved));
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                     std::string("Cannot sync key file: ") + std::strerror(errno));
    }
    return Ok();
}

}  // namespace

AesGcmEncryptionService::AesGcmEncryptionService(std::filesystem::path key_file,
                                                 std::shared_ptr<Logger> logger)
    : key_file_(std::move(key_file))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
{}

Result<AesGcmEncryptionService::Key> AesGcmEncryptionService::load_or_create_key() {
    if (key_) {
        return *key_;
    }

    std::error_code ec;
    bool exists = std::filesystem::exists(key_file_, ec);
    if (ec) {
        return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                     "Cannot stat key file: " + ec.message());
    }

    Key key{};
    if (!exists) {
        std::filesystem::create_directories(key_file_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                         "Cannot create key directory: " + ec.message());
        }
        if (!random_bytes(key.data(), key.size())) {
            return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE, "Random source failed");
        }
        auto written = write_key_file(key_file_, key.data(), key.size());
        if (written.ok()) {
            logger_->info("Created history encryption key at " + key_file_.string());
            key_ = key;
            return key;
        }
        // Another process may have created it first; fall through and read it
        if (!std::filesystem::exists(key_file_, ec)) {
            return written.error();
        }
    }

    std::ifstream in(key_file_, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                     "Cannot open key file " + key_file_.string());
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.size() != KEY_SIZE) {
        return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                     "Key file has wrong size: " + std::to_string(bytes.size()));
    }
    std::memcpy(key.data(), bytes.data(), KEY_SIZE);
    key_ = key;
    return key;
}

Result<std::string> AesGcmEncryptionService::encrypt(const std::string& clear) {
    Key key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto loaded = load_or_create_key();
        if (!loaded.ok()) {
            return loaded.error();
        }
        key = *loaded;
    }

    uint8_t nonce[NONCE_SIZE];
    if (!random_bytes(nonce, sizeof(nonce))) {
        return Error(ErrorCode::ENCRYPTION_FAILED, "Random source failed");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Error(ErrorCode::ENCRYPTION_FAILED, "EVP_CIPHER_CTX_new failed");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return Error(ErrorCode::ENCRYPTION_FAILED, "Cipher initialization failed");
    }

    std::string ciphertext(clear.size(), '\0');
    int out_len = 0;
    if (!clear.empty() &&
        EVP_EncryptUpdate(ctx.get(), as_bytes(ciphertext), &out_len,
                          as_bytes(clear), static_cast<int>(clear.size())) != 1) {
        return Error(ErrorCode::ENCRYPTION_FAILED, "EVP_EncryptUpdate failed");
    }

    int final_len = 0;
    unsigned char scratch[16];
    if (EVP_EncryptFinal_ex(ctx.get(), scratch, &final_len) != 1) {
        return Error(ErrorCode::ENCRYPTION_FAILED, "EVP_EncryptFinal_ex failed");
    }

    uint8_t tag[TAG_SIZE];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, tag) != 1) {
        return Error(ErrorCode::ENCRYPTION_FAILED, "Cannot read authentication tag");
    }

    BinaryWriter writer;
    writer.reserve(MAGIC_SIZE + NONCE_SIZE + TAG_SIZE + ciphertext.size());
    writer.write_raw(MAGIC, MAGIC_SIZE);
    writer.write_raw(nonce, NONCE_SIZE);
    writer.write_raw(tag, TAG_SIZE);
    writer.write_raw(ciphertext);
    return writer.release();
}

Result<std::string> AesGcmEncryptionService::decrypt(const std::string& encrypted) {
    BinaryReader reader(encrypted);

    char magic[MAGIC_SIZE];
    uint8_t nonce[NONCE_SIZE];
    uint8_t tag[TAG_SIZE];
    if (!reader.read_raw(magic, MAGIC_SIZE) || std::memcmp(magic, MAGIC, MAGIC_SIZE) != 0) {
        return Error(ErrorCode::ENCRYPTED_PAYLOAD_INVALID, "Missing envelope header");
    }
    if (!reader.read_raw(nonce, NONCE_SIZE) || !reader.read_raw(tag, TAG_SIZE)) {
        return Error(ErrorCode::ENCRYPTED_PAYLOAD_INVALID, "Envelope is truncated");
    }
    std::string ciphertext = reader.read_rest();

    Key key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto loaded = load_or_create_key();
        if (!loaded.ok()) {
            return loaded.error();
        }
        key = *loaded;
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Error(ErrorCode::DECRYPTION_FAILED, "EVP_CIPHER_CTX_new failed");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return Error(ErrorCode::DECRYPTION_FAILED, "Cipher initialization failed");
    }

    std::string clear(ciphertext.size(), '\0');
    int out_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), as_bytes(clear), &out_len,
                          as_bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        return Error(ErrorCode::DECRYPTION_FAILED, "EVP_DecryptUpdate failed");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag) != 1) {
        return Error(ErrorCode::DECRYPTION_FAILED, "Cannot set authentication tag");
    }

    int final_len = 0;
    unsigned char scratch[16];
    if (EVP_DecryptFinal_ex(ctx.get(), scratch, &final_len) != 1) {
        return Error(ErrorCode::DECRYPTION_FAILED, "Authentication failed");
    }

    return clear;
}

}  // namespace clipstash
