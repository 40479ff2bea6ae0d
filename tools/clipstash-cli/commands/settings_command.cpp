#include "settings_command.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iomanip>
#include <map>
#include <stdexcept>

namespace clipstash::cli {

namespace {

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return std::tolower(c); });
    if (lower == "true" || lower == "on" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "off" || lower == "no" || lower == "0") return false;
    return std::nullopt;
}

using Setter = std::function<Result<void>(Settings&, const std::string&)>;

Setter bool_field(bool Settings::*field) {
    return [field](Settings& s, const std::string& value) -> Result<void> {
        auto parsed = parse_bool(value);
        if (!parsed) {
            return Error(ErrorCode::VALIDATION_ERROR, "Expected true/false, got '" + value + "'");
        }
        s.*field = *parsed;
        return Ok();
    };
}

Setter double_field(double Settings::*field) {
    return [field](Settings& s, const std::string& value) -> Result<void> {
        try {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            s.*field = parsed;
        } catch (const std::logic_error&) {
            return Error(ErrorCode::VALIDATION_ERROR, "Expected a number, got '" + value + "'");
        }
        return Ok();
    };
}

Setter string_field(std::string Settings::*field) {
    return [field](Settings& s, const std::string& value) -> Result<void> {
        s.*field = value;
        return Ok();
    };
}

const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = {
        {"launch_at_login", bool_field(&Settings::launch_at_login)},
        {"remember_history", bool_field(&Settings::remember_history)},
        {"show_recent", bool_field(&Settings::show_recent)},
        {"show_pinned", bool_field(&Settings::show_pinned)},
        {"auto_paste_enabled", bool_field(&Settings::auto_paste_enabled)},
        {"enable_history_limit", bool_field(&Settings::enable_history_limit)},
        {"auto_show_on_edge", bool_field(&Settings::auto_show_on_edge)},
        {"capture_rich_text", bool_field(&Settings::capture_rich_text)},
        {"snippets_enabled", bool_field(&Settings::snippets_enabled)},
        {"encrypt_history", bool_field(&Settings::encrypt_history)},
        {"incognito_mode", bool_field(&Settings::incognito_mode)},
        {"auto_show_delay", double_field(&Settings::auto_show_delay)},
        {"auto_hide_delay", double_field(&Settings::auto_hide_delay)},
        {"font_size_scale", double_field(&Settings::font_size_scale)},
        {"density_mode", string_field(&Settings::density_mode)},
        {"theme_override", string_field(&Settings::theme_override)},
        {"max_history_items", [](Settings& s, const std::string& value) -> Result<void> {
            try {
                size_t used = 0;
                int parsed = std::stoi(value, &used);
                if (used != value.size()) {
                    throw std::invalid_argument(value);
                }
                s.max_history_items = parsed;
            } catch (const std::logic_error&) {
                return Error(ErrorCode::VALIDATION_ERROR, "Expected an integer, got '" + value + "'");
            }
            return Ok();
        }},
        {"keyboard_shortcut", [](Settings& s, const std::string& value) -> Result<void> {
            auto parsed = KeyboardShortcut::parse(value);
            if (!parsed) {
                return Error(ErrorCode::SETTINGS_SHORTCUT_INVALID,
                             "Cannot parse shortcut '" + value + "'");
            }
            s.keyboard_shortcut = *parsed;
            return Ok();
        }},
    };
    return table;
}

void print_settings(const Settings& s) {
    auto row = [](const std::string& key, const std::string& value) {
        std::cout << std::left << std::setw(24) << key << value << "\n";
    };
    auto flag = [](bool b) { return std::string(b ? "true" : "false"); };

    row("launch_at_login", flag(s.launch_at_login));
    row("keyboard_shortcut", s.keyboard_shortcut.display);
    row("remember_history", flag(s.remember_history));
    row("show_recent", flag(s.show_recent));
    row("show_pinned", flag(s.show_pinned));
    row("auto_paste_enabled", flag(s.auto_paste_enabled));
    row("max_history_items", std::to_string(s.max_history_items));
    row("enable_history_limit", flag(s.enable_history_limit));
    row("auto_show_on_edge", flag(s.auto_show_on_edge));
    row("auto_show_delay", std::to_string(s.auto_show_delay));
    row("auto_hide_delay", std::to_string(s.auto_hide_delay));
    row("capture_rich_text", flag(s.capture_rich_text));
    row("snippets_enabled", flag(s.snippets_enabled));
    row("density_mode", s.density_mode);
    row("font_size_scale", std::to_string(s.font_size_scale));
    row("theme_override", s.theme_override);
    row("encrypt_history", flag(s.encrypt_history));
    row("incognito_mode", flag(s.incognito_mode));

    std::string excluded;
    for (const auto& app : s.excluded_app_ids) {
        if (!excluded.empty()) excluded += ", ";
        excluded += app;
    }
    row("excluded_app_ids", excluded.empty() ? "-" : excluded);
    row("(effective limit)", std::to_string(s.effective_history_limit()));
}

}  // namespace

void SettingsCommand::setup(CLI::App& app) {
    app.add_option("assignments", assignments_, "key=value pairs to apply")
        ->type_name("<key=value>");

    app.add_option("--exclude", exclude_, "Exclude a source application (repeatable)")
        ->type_name("<app>");

    app.add_option("--include", include_, "Remove a source application from the exclusions")
        ->type_name("<app>");
}

int SettingsCommand::execute(CommandContext& ctx) {
    Settings settings = ctx.store->settings();

    if (assignments_.empty() && exclude_.empty() && include_.empty()) {
        print_settings(settings);
        return CLIPSTASH_EXIT_SUCCESS;
    }

    for (const auto& assignment : assignments_) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: Expected key=value, got '" << assignment << "'\n";
            return CLIPSTASH_EXIT_USER_ERROR;
        }
        std::string key = assignment.substr(0, eq);
        std::string value = assignment.substr(eq + 1);

        auto it = setters().find(key);
        if (it == setters().end()) {
            std::cerr << "Error: Unknown setting: " << key << "\n";
            return CLIPSTASH_EXIT_USER_ERROR;
        }
        auto applied = it->second(settings, value);
        if (!applied.ok()) {
            return report_error(applied.error());
        }
    }

    for (const auto& app : exclude_) {
        settings.excluded_app_ids.insert(app);
    }
    for (const auto& app : include_) {
        settings.excluded_app_ids.erase(app);
    }

    auto result = ctx.store->save_settings(settings);
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Settings saved.\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
