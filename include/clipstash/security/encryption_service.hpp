#pragma once

#include <clipstash/result.hpp>

#include <string>

namespace clipstash {

/**
 * EncryptionService - Symmetric protection for persisted history.
 *
 * Implementations must be thread safe and must report every failure
 * through Result instead of throwing.
 */
class EncryptionService {
public:
    virtual ~EncryptionService() = default;

    virtual Result<std::string> encrypt(const std::string& clear) = 0;
    virtual Result<std::string> decrypt(const std::string& encrypted) = 0;
};

}  // namespace clipstash
