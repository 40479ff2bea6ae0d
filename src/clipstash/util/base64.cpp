#include <clipstash/util/base64.hpp>

#include <openssl/evp.h>

#include <vector>

namespace clipstash {

std::string base64_encode(const std::string& input) {
    if (input.empty()) {
        return "";
    }

    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written));
}

std::optional<std::string> base64_decode(const std::string& input) {
    if (input.empty()) {
        return std::string();
    }
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(3 * (input.size() / 4) + 1);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding characters as zero bytes
    size_t padding = 0;
    if (input[input.size() - 1] == '=') ++padding;
    if (input[input.size() - 2] == '=') ++padding;

    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written) - padding);
}

}  // namespace clipstash
