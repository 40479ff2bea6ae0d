#pragma once

#include <optional>
#include <string>

namespace clipstash {

/**
 * Percent-encode every byte outside the RFC 3986 unreserved set
 * (ALPHA / DIGIT / "-" / "." / "_" / "~").
 */
std::string url_encode(const std::string& input);

/**
 * Decode %XX escapes. Returns std::nullopt when an escape is truncated
 * or not hexadecimal. '+' is left unchanged.
 */
std::optional<std::string> url_decode(const std::string& input);

}  // namespace clipstash
