#pragma once

#include <clipstash/security/encryption_service.hpp>
#include <clipstash/util/logger.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace clipstash {

/**
 * AesGcmEncryptionService - AES-256-GCM with a per-installation key.
 *
 * Envelope layout:
 *   "CSE1" | nonce (12 bytes) | tag (16 bytes) | ciphertext
 *
 * The 32-byte key lives in a file created with mode 0600 on first use
 * and is cached for the lifetime of the service.
 */
class AesGcmEncryptionService : public EncryptionService {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr char MAGIC[5] = "CSE1";

    explicit AesGcmEncryptionService(std::filesystem::path key_file,
                                     std::shared_ptr<Logger> logger = nullptr);

    Result<std::string> encrypt(const std::string& clear) override;
    Result<std::string> decrypt(const std::string& encrypted) override;

    const std::filesystem::path& key_file() const { return key_file_; }

private:
    using Key = std::array<uint8_t, KEY_SIZE>;

    // Load the key from disk, creating it when absent. Caller holds mutex_.
    Result<Key> load_or_create_key();

    std::filesystem::path key_file_;
    std::shared_ptr<Logger> logger_;
    std::mutex mutex_;
    std::optional<Key> key_;
};

}  // namespace clipstash
