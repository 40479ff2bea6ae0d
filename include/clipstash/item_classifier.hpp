#pragma once

#include <clipstash/core_types.hpp>

#include <string>

namespace clipstash {

/**
 * Assigns a text-family type to captured plain text.
 *
 * Detection priority:
 * 1. Email address or mailto: URI
 * 2. Absolute URI with a scheme
 * 3. Phone number
 * 4. JSON object or array that parses
 * 5. Hex, rgb(), rgba(), hsl() or hsla() color
 * 6. Source code (at least two code indicators)
 * 7. TEXT otherwise
 */
class ItemClassifier {
public:
    static ItemType classify(const std::string& text);

private:
    static bool is_email(const std::string& s);
    static bool is_mailto(const std::string& s);
    static bool is_url(const std::string& s);
    static bool is_phone(const std::string& s);
    static bool is_json(const std::string& s);
    static bool is_color(const std::string& s);
    static bool looks_like_code(const std::string& s);
};

}  // namespace clipstash
