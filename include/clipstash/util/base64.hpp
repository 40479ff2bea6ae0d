#pragma once

#include <optional>
#include <string>

namespace clipstash {

// Encodes the input bytes in standard base64 with padding.
std::string base64_encode(const std::string& input);

// Decodes standard base64. Returns std::nullopt on malformed input.
std::optional<std::string> base64_decode(const std::string& input);

}  // namespace clipstash
