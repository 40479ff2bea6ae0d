#include <clipstash/item_classifier.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <regex>

namespace clipstash {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// scheme ":" rest, scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool split_scheme(const std::string& s, std::string* scheme, std::string* rest) {
    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    *scheme = to_lower(s.substr(0, colon));
    *rest = s.substr(colon + 1);
    return true;
}

}  // namespace

ItemType ItemClassifier::classify(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return ItemType::TEXT;
    }

    if (is_email(trimmed) || is_mailto(trimmed)) return ItemType::EMAIL;
    if (is_url(trimmed)) return ItemType::URL;
    if (is_phone(trimmed)) return ItemType::PHONE;
    if (is_json(trimmed)) return ItemType::JSON;
    if (is_color(trimmed)) return ItemType::COLOR;
    if (looks_like_code(trimmed)) return ItemType::CODE;

    return ItemType::TEXT;
}

bool ItemClassifier::is_email(const std::string& s) {
    static const std::regex EMAIL(R"(^[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}$)");
    return std::regex_match(s, EMAIL);
}

bool ItemClassifier::is_mailto(const std::string& s) {
    std::string scheme, rest;
    return split_scheme(s, &scheme, &rest) && scheme == "mailto" && !rest.empty();
}

bool ItemClassifier::is_url(const std::string& s) {
    if (std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); })) {
        return false;
    }

    std::string scheme, rest;
    if (!split_scheme(s, &scheme, &rest) || scheme == "mailto" || rest.empty()) {
        return false;
    }

    // Hierarchical URIs need an authority or an absolute path
    if (scheme == "http" || scheme == "https" || scheme == "ftp" ||
        scheme == "ws" || scheme == "wss") {
        return rest.size() > 2 && rest.compare(0, 2, "//") == 0;
    }
    if (scheme == "file") {
        return rest.compare(0, 1, "/") == 0;
    }
    // A single letter before ':' is a Windows drive path, not a scheme
    return scheme.size() > 1 && rest.compare(0, 2, "//") == 0;
}

bool ItemClassifier::is_phone(const std::string& s) {
    static const std::regex PHONE(R"(^[+]?[(]?[0-9]{1,4}[)]?[-\s./0-9]{6,}$)");
    return std::regex_match(s, PHONE);
}

bool ItemClassifier::is_json(const std::string& s) {
    if (s.size() < 2) return false;

    char first = s.front();
    char last = s.back();
    bool candidate = (first == '{' && last == '}') || (first == '[' && last == ']');
    if (!candidate) return false;

    return nlohmann::json::accept(s);
}

bool ItemClassifier::is_color(const std::string& s) {
    static const std::regex HEX(R"(^#([0-9a-fA-F]{3}){1,2}$)");
    if (std::regex_match(s, HEX)) return true;

    std::string lower = to_lower(s);
    return lower.rfind("rgb(", 0) == 0 || lower.rfind("rgba(", 0) == 0 ||
           lower.rfind("hsl(", 0) == 0 || lower.rfind("hsla(", 0) == 0;
}

bool ItemClassifier::looks_like_code(const std::string& s) {
    static const std::regex CONTROL_FLOW(R"(^\s*(if|for|while)\s*\()");

    size_t line_count = static_cast<size_t>(std::count(s.begin(), s.end(), '\n')) + 1;

    const bool indicators[] = {
        contains(s, "func ") || contains(s, "function "),
        contains(s, "class ") || contains(s, "struct "),
        contains(s, "import ") || contains(s, "package ") || contains(s, "#include"),
        contains(s, "const ") || contains(s, "let ") || contains(s, "var "),
        contains(s, "def ") || contains(s, "=>"),
        line_count > 3 && (contains(s, "{") || contains(s, ":")),
        contains(s, "public ") || contains(s, "private "),
        std::regex_search(s, CONTROL_FLOW),
    };

    return std::count(std::begin(indicators), std::end(indicators), true) >= 2;
}

}  // namespace clipstash
