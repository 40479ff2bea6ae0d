#pragma once

#include <clipstash/core_types.hpp>
#include <clipstash/result.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace clipstash {

enum ShortcutModifier : uint32_t {
    MODIFIER_NONE = 0,
    MODIFIER_CONTROL = 1u << 0,
    MODIFIER_ALT = 1u << 1,
    MODIFIER_SHIFT = 1u << 2,
    MODIFIER_SUPER = 1u << 3
};

/**
 * Global shortcut that toggles the clipboard panel.
 *
 * key_code is the ASCII upper-case character for letters and digits;
 * the hotkey backend maps it to its platform key symbol.
 */
struct KeyboardShortcut {
    uint32_t key_code = 'V';
    uint32_t modifiers = MODIFIER_CONTROL | MODIFIER_SHIFT;
    std::string display;

    /**
     * Parse a "Ctrl+Shift+V" style string. Modifier names are
     * case-insensitive (ctrl/control, alt, shift, super/win/meta).
     */
    static std::optional<KeyboardShortcut> parse(const std::string& text);

    // Canonical "Ctrl+Shift+V" rendering
    std::string to_string() const;

    bool operator==(const KeyboardShortcut& other) const {
        return key_code == other.key_code &&
               modifiers == other.modifiers &&
               display == other.display;
    }
    bool operator!=(const KeyboardShortcut& other) const { return !(*this == other); }
};

KeyboardShortcut default_shortcut();

/**
 * Settings - Process-wide configuration record.
 *
 * Treated as an immutable value: the store replaces the whole record
 * on every accepted update.
 */
struct Settings {
    bool launch_at_login = false;
    KeyboardShortcut keyboard_shortcut = default_shortcut();
    bool remember_history = true;
    bool show_recent = true;
    bool show_pinned = true;
    bool auto_paste_enabled = false;
    int max_history_items = 100;
    bool enable_history_limit = false;
    bool auto_show_on_edge = false;
    double auto_show_delay = 0.3;   // seconds
    double auto_hide_delay = 0.5;   // seconds
    bool capture_rich_text = true;
    bool snippets_enabled = true;
    std::string density_mode = "comfortable";
    double font_size_scale = 1.0;
    std::string theme_override = "dark";
    bool encrypt_history = false;
    bool incognito_mode = false;
    std::set<std::string> excluded_app_ids;

    /**
     * The history cap the eviction algorithm uses: max_history_items
     * clamped into [MIN_HISTORY_ITEMS, MAX_HISTORY_ITEMS_HARD_LIMIT]
     * when limiting is enabled, otherwise the hard limit.
     */
    size_t effective_history_limit() const;

    /**
     * Range-check numeric and enumerated fields and the shortcut.
     *
     * @return SETTINGS_RANGE_INVALID or SETTINGS_SHORTCUT_INVALID on failure
     */
    Result<void> validate() const;

    /**
     * Whether captures from this source application must be ignored.
     */
    bool is_excluded_source(const std::optional<std::string>& app_id) const;

    bool operator==(const Settings& other) const;
    bool operator!=(const Settings& other) const { return !(*this == other); }
};

}  // namespace clipstash
