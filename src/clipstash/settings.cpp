#include <clipstash/settings.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace clipstash {

namespace {

constexpr double MAX_EDGE_DELAY_SECONDS = 10.0;
constexpr double MIN_FONT_SCALE = 0.5;
constexpr double MAX_FONT_SCALE = 3.0;

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string strip_suffix(const std::string& s, const std::string& suffix) {
    if (s.size() > suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return s.substr(0, s.size() - suffix.size());
    }
    return s;
}

std::string key_name(uint32_t key_code) {
    if (key_code >= 0x21 && key_code <= 0x7E) {
        return std::string(1, static_cast<char>(key_code));
    }
    if (key_code == ' ') return "Space";
    std::ostringstream out;
    out << "0x" << std::hex << std::uppercase << key_code;
    return out.str();
}

}  // namespace

// ============================================================================
// KeyboardShortcut
// ============================================================================

KeyboardShortcut default_shortcut() {
    KeyboardShortcut shortcut;
    shortcut.display = shortcut.to_string();
    return shortcut;
}

std::optional<KeyboardShortcut> KeyboardShortcut::parse(const std::string& text) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream in(text);
    while (std::getline(in, token, '+')) {
        parts.push_back(trim(token));
    }
    if (parts.empty()) {
        return std::nullopt;
    }

    KeyboardShortcut shortcut;
    shortcut.modifiers = MODIFIER_NONE;
    shortcut.key_code = 0;

    for (size_t i = 0; i < parts.size(); ++i) {
        std::string lower = to_lower(parts[i]);
        bool last = (i + 1 == parts.size());

        if (!last) {
            if (lower == "ctrl" || lower == "control") {
                shortcut.modifiers |= MODIFIER_CONTROL;
            } else if (lower == "alt") {
                shortcut.modifiers |= MODIFIER_ALT;
            } else if (lower == "shift") {
                shortcut.modifiers |= MODIFIER_SHIFT;
            } else if (lower == "super" || lower == "win" || lower == "meta") {
                shortcut.modifiers |= MODIFIER_SUPER;
            } else {
                return std::nullopt;
            }
            continue;
        }

        if (lower == "space") {
            shortcut.key_code = ' ';
        } else if (parts[i].size() == 1 && std::isgraph(static_cast<unsigned char>(parts[i][0]))) {
            shortcut.key_code = static_cast<uint32_t>(
                std::toupper(static_cast<unsigned char>(parts[i][0])));
        } else {
            return std::nullopt;
        }
    }

    shortcut.display = shortcut.to_string();
    return shortcut;
}

std::string KeyboardShortcut::to_string() const {
    std::string out;
    if (modifiers & MODIFIER_CONTROL) out += "Ctrl+";
    if (modifiers & MODIFIER_ALT) out += "Alt+";
    if (modifiers & MODIFIER_SHIFT) out += "Shift+";
    if (modifiers & MODIFIER_SUPER) out += "Super+";
    out += key_name(key_code);
    return out;
}

// ============================================================================
// Settings
// ============================================================================

size_t Settings::effective_history_limit() const {
    if (!enable_history_limit) {
        return limits::MAX_HISTORY_ITEMS_HARD_LIMIT;
    }
    size_t configured = max_history_items > 0 ? static_cast<size_t>(max_history_items) : 0;
    return std::min(std::max(configured, limits::MIN_HISTORY_ITEMS),
                    limits::MAX_HISTORY_ITEMS_HARD_LIMIT);
}

Result<void> Settings::validate() const {
    if (max_history_items < 1 || max_history_items > limits::MAX_HISTORY_ITEMS_SETTING) {
        return Error(ErrorCode::SETTINGS_RANGE_INVALID,
                     "max_history_items must be between 1 and " +
                     std::to_string(limits::MAX_HISTORY_ITEMS_SETTING));
    }
    if (!(auto_show_delay >= 0.0 && auto_show_delay <= MAX_EDGE_DELAY_SECONDS)) {
        return Error(ErrorCode::SETTINGS_RANGE_INVALID,
                     "auto_show_delay must be between 0 and 10 seconds");
    }
    if (!(auto_hide_delay >= 0.0 && auto_hide_delay <= MAX_EDGE_DELAY_SECONDS)) {
        return Error(ErrorCode::SETTINGS_RANGE_INVALID,
                     "auto_hide_delay must be between 0 and 10 seconds");
    }
    if (!(font_size_scale >= MIN_FONT_SCALE && font_size_scale <= MAX_FONT_SCALE)) {
        return Error(ErrorCode::SETTINGS_RANGE_INVALID,
                     "font_size_scale must be between 0.5 and 3.0");
    }
    if (density_mode != "compact" && density_mode != "comfortable") {
        return Error(ErrorCode::SETTINGS_RANGE_INVALID,
                     "density_mode must be 'compact' or 'comfortable'");
    }
    if (theme_override != "dark" && theme_override != "light" && theme_override != "system") {
        return Error(ErrorCode::SETTINGS_RANGE_INVALID,
                     "theme_override must be 'dark', 'light' or 'system'");
    }

    const auto& shortcut = keyboard_shortcut;
    if (shortcut.key_code == 0 || shortcut.key_code > 0xFF) {
        return Error(ErrorCode::SETTINGS_SHORTCUT_INVALID, "Shortcut key code is out of range");
    }
    if (shortcut.modifiers == MODIFIER_NONE) {
        return Error(ErrorCode::SETTINGS_SHORTCUT_INVALID, "Shortcut requires at least one modifier");
    }
    if ((shortcut.modifiers & ~(MODIFIER_CONTROL | MODIFIER_ALT | MODIFIER_SHIFT | MODIFIER_SUPER)) != 0) {
        return Error(ErrorCode::SETTINGS_SHORTCUT_INVALID, "Shortcut has unknown modifier bits");
    }
    if (trim(shortcut.display).empty()) {
        return Error(ErrorCode::SETTINGS_SHORTCUT_INVALID, "Shortcut display string is empty");
    }

    return Ok();
}

bool Settings::is_excluded_source(const std::optional<std::string>& app_id) const {
    if (excluded_app_ids.empty() || !app_id) {
        return false;
    }

    std::string source = to_lower(trim(*app_id));
    if (source.empty()) {
        return false;
    }
    std::string bare = strip_suffix(strip_suffix(source, ".exe"), ".desktop");

    for (const auto& excluded : excluded_app_ids) {
        std::string candidate = to_lower(trim(excluded));
        if (candidate.empty()) {
            continue;
        }
        if (candidate == source || candidate == bare) {
            return true;
        }
    }
    return false;
}

bool Settings::operator==(const Settings& other) const {
    return launch_at_login == other.launch_at_login &&
           keyboard_shortcut == other.keyboard_shortcut &&
           remember_history == other.remember_history &&
           show_recent == other.show_recent &&
           show_pinned == other.show_pinned &&
           auto_paste_enabled == other.auto_paste_enabled &&
           max_history_items == other.max_history_items &&
           enable_history_limit == other.enable_history_limit &&
           auto_show_on_edge == other.auto_show_on_edge &&
           auto_show_delay == other.auto_show_delay &&
           auto_hide_delay == other.auto_hide_delay &&
           capture_rich_text == other.capture_rich_text &&
           snippets_enabled == other.snippets_enabled &&
           density_mode == other.density_mode &&
           font_size_scale == other.font_size_scale &&
           theme_override == other.theme_override &&
           encrypt_history == other.encrypt_history &&
           incognito_mode == other.incognito_mode &&
           excluded_app_ids == other.excluded_app_ids;
}

}  // namespace clipstash
