#include <clipstash/util/uuid.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdint>
#include <stdexcept>

namespace clipstash {

bool random_bytes(void* buffer, size_t size) {
    return RAND_bytes(static_cast<unsigned char*>(buffer), static_cast<int>(size)) == 1;
}

std::string generate_uuid() {
    return generate_uuid(&random_bytes);
}

std::string generate_uuid(RandomSource source) {
    uint8_t bytes[16];
    if (!source(bytes, sizeof(bytes))) {
        char reason[256] = "unknown error";
        unsigned long code = ERR_get_error();
        if (code != 0) {
            ERR_error_string_n(code, reason, sizeof(reason));
        }
        throw std::runtime_error(std::string("Failed to generate identifier: ") + reason);
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX[bytes[i] >> 4]);
        out.push_back(HEX[bytes[i] & 0x0F]);
    }
    return out;
}

}  // namespace clipstash
