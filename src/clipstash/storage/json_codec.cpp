#include <clipstash/storage/json_codec.hpp>
#include <clipstash/util/base64.hpp>

namespace clipstash {
namespace storage {

namespace {

// Clipboard text is not guaranteed to be valid UTF-8; replace rather than fail
std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<json> parse(const std::string& data, const char* what) {
    try {
        return json::parse(data);
    } catch (const json::exception& e) {
        return Error(ErrorCode::DESERIALIZATION_FAILED,
                     std::string("Failed to parse ") + what + ": " + e.what());
    }
}

template<typename T, typename Decode>
Result<std::vector<T>> decode_array(const json& j, const char* what, Decode decode) {
    if (!j.is_array()) {
        return Error(ErrorCode::DATA_FORMAT_INVALID, std::string(what) + " is not a JSON array");
    }
    std::vector<T> out;
    out.reserve(j.size());
    for (const auto& element : j) {
        auto decoded = decode(element);
        if (!decoded.ok()) {
            return decoded.error();
        }
        out.push_back(std::move(decoded).value());
    }
    return out;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

// ============================================================================
// ClipboardItem / PinnedItem
// ============================================================================

json item_to_json(const ClipboardItem& item) {
    json j;
    j["id"] = item.id();
    j["type"] = item_type_name(item.type());
    j["timestamp"] = to_epoch_millis(item.timestamp());
    if (item.source().app_id) j["source_app"] = *item.source().app_id;
    if (item.source().executable_path) j["source_path"] = *item.source().executable_path;

    if (const auto* text = item.text()) {
        j["text"] = *text;
    } else if (const auto* bytes = item.image_bytes()) {
        j["image"] = base64_encode(*bytes);
    } else if (const auto* path = item.file_path()) {
        j["path"] = *path;
    } else if (const auto* rich = item.rich_text()) {
        json r;
        r["plain"] = rich->plain_text;
        if (rich->rtf) r["rtf"] = *rich->rtf;
        if (rich->html) r["html"] = *rich->html;
        j["rich_text"] = std::move(r);
    }
    return j;
}

Result<ClipboardItem> item_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Clipboard item is not an object");
        }

        std::string id = j.at("id").get<std::string>();
        if (id.empty()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Clipboard item has an empty id");
        }

        std::string type_name = j.at("type").get<std::string>();
        auto type = parse_item_type(type_name);
        if (!type) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Unknown item type '" + type_name + "'");
        }

        Timestamp timestamp = from_epoch_millis(j.at("timestamp").get<int64_t>());
        ItemSource source{optional_string(j, "source_app"), optional_string(j, "source_path")};

        ItemPayload payload;
        if (is_text_family(*type)) {
            payload = TextPayload{j.at("text").get<std::string>()};
        } else if (*type == ItemType::IMAGE) {
            auto bytes = base64_decode(j.at("image").get<std::string>());
            if (!bytes) {
                return Error(ErrorCode::DATA_FORMAT_INVALID, "Image payload is not valid base64");
            }
            payload = ImagePayload{std::move(*bytes)};
        } else if (*type == ItemType::FILE) {
            payload = FilePayload{j.at("path").get<std::string>()};
        } else {
            const json& r = j.at("rich_text");
            payload = RichTextPayload{r.at("plain").get<std::string>(),
                                      optional_string(r, "rtf"),
                                      optional_string(r, "html")};
        }

        auto item = ClipboardItem::create(std::move(id), *type, timestamp,
                                          std::move(payload), std::move(source));
        if (!item.ok()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, item.error().message());
        }
        return item;
    } catch (const json::exception& e) {
        return Error(ErrorCode::DATA_FORMAT_INVALID,
                     std::string("Invalid clipboard item: ") + e.what());
    }
}

json pinned_to_json(const PinnedItem& pinned) {
    json j;
    j["id"] = pinned.id;
    j["pinned_at"] = to_epoch_millis(pinned.pinned_at);
    if (pinned.custom_title) j["title"] = *pinned.custom_title;
    j["item"] = item_to_json(pinned.item);
    return j;
}

Result<PinnedItem> pinned_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Pinned item is not an object");
        }
        auto item = item_from_json(j.at("item"));
        if (!item.ok()) {
            return item.error();
        }

        std::string id = j.at("id").get<std::string>();
        if (id.empty()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Pinned item has an empty id");
        }

        return PinnedItem{std::move(id),
                          std::move(item).value(),
                          from_epoch_millis(j.at("pinned_at").get<int64_t>()),
                          optional_string(j, "title")};
    } catch (const json::exception& e) {
        return Error(ErrorCode::DATA_FORMAT_INVALID,
                     std::string("Invalid pinned item: ") + e.what());
    }
}

// ============================================================================
// Snippet
// ============================================================================

json snippet_to_json(const Snippet& snippet) {
    json j;
    j["id"] = snippet.id;
    j["title"] = snippet.title;
    j["content"] = snippet.content;
    j["category"] = snippet.category;
    j["created_at"] = to_epoch_millis(snippet.created_at);
    if (snippet.last_used_at) j["last_used_at"] = to_epoch_millis(*snippet.last_used_at);
    return j;
}

Result<Snippet> snippet_from_json(const json& j) {
    try {
        Snippet snippet;
        snippet.id = j.at("id").get<std::string>();
        snippet.title = j.at("title").get<std::string>();
        snippet.content = j.at("content").get<std::string>();
        snippet.category = j.value("category", std::string());
        snippet.created_at = from_epoch_millis(j.at("created_at").get<int64_t>());

        auto it = j.find("last_used_at");
        if (it != j.end() && !it->is_null()) {
            snippet.last_used_at = from_epoch_millis(it->get<int64_t>());
        }

        if (snippet.id.empty()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Snippet has an empty id");
        }
        return snippet;
    } catch (const json::exception& e) {
        return Error(ErrorCode::DATA_FORMAT_INVALID,
                     std::string("Invalid snippet: ") + e.what());
    }
}

// ============================================================================
// Settings
// ============================================================================

json settings_to_json(const Settings& s) {
    json j;
    j["launch_at_login"] = s.launch_at_login;
    j["keyboard_shortcut"] = {
        {"key_code", s.keyboard_shortcut.key_code},
        {"modifiers", s.keyboard_shortcut.modifiers},
        {"display", s.keyboard_shortcut.display}
    };
    j["remember_history"] = s.remember_history;
    j["show_recent"] = s.show_recent;
    j["show_pinned"] = s.show_pinned;
    j["auto_paste_enabled"] = s.auto_paste_enabled;
    j["max_history_items"] = s.max_history_items;
    j["enable_history_limit"] = s.enable_history_limit;
    j["auto_show_on_edge"] = s.auto_show_on_edge;
    j["auto_show_delay"] = s.auto_show_delay;
    j["auto_hide_delay"] = s.auto_hide_delay;
    j["capture_rich_text"] = s.capture_rich_text;
    j["snippets_enabled"] = s.snippets_enabled;
    j["density_mode"] = s.density_mode;
    j["font_size_scale"] = s.font_size_scale;
    j["theme_override"] = s.theme_override;
    j["encrypt_history"] = s.encrypt_history;
    j["incognito_mode"] = s.incognito_mode;
    j["excluded_app_ids"] = s.excluded_app_ids;
    return j;
}

Result<Settings> settings_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Settings record is not an object");
        }

        Settings s;
        s.launch_at_login = j.value("launch_at_login", s.launch_at_login);
        if (j.contains("keyboard_shortcut")) {
            const json& k = j.at("keyboard_shortcut");
            s.keyboard_shortcut.key_code = k.value("key_code", s.keyboard_shortcut.key_code);
            s.keyboard_shortcut.modifiers = k.value("modifiers", s.keyboard_shortcut.modifiers);
            s.keyboard_shortcut.display = k.value("display", s.keyboard_shortcut.to_string());
        }
        s.remember_history = j.value("remember_history", s.remember_history);
        s.show_recent = j.value("show_recent", s.show_recent);
        s.show_pinned = j.value("show_pinned", s.show_pinned);
        s.auto_paste_enabled = j.value("auto_paste_enabled", s.auto_paste_enabled);
        s.max_history_items = j.value("max_history_items", s.max_history_items);
        s.enable_history_limit = j.value("enable_history_limit", s.enable_history_limit);
        s.auto_show_on_edge = j.value("auto_show_on_edge", s.auto_show_on_edge);
        s.auto_show_delay = j.value("auto_show_delay", s.auto_show_delay);
        s.auto_hide_delay = j.value("auto_hide_delay", s.auto_hide_delay);
        s.capture_rich_text = j.value("capture_rich_text", s.capture_rich_text);
        s.snippets_enabled = j.value("snippets_enabled", s.snippets_enabled);
        s.density_mode = j.value("density_mode", s.density_mode);
        s.font_size_scale = j.value("font_size_scale", s.font_size_scale);
        s.theme_override = j.value("theme_override", s.theme_override);
        s.encrypt_history = j.value("encrypt_history", s.encrypt_history);
        s.incognito_mode = j.value("incognito_mode", s.incognito_mode);
        if (j.contains("excluded_app_ids")) {
            s.excluded_app_ids = j.at("excluded_app_ids").get<std::set<std::string>>();
        }
        return s;
    } catch (const json::exception& e) {
        return Error(ErrorCode::DATA_FORMAT_INVALID,
                     std::string("Invalid settings: ") + e.what());
    }
}

// ============================================================================
// Aggregate documents
// ============================================================================

std::string encode_history(const std::vector<ClipboardItem>& items) {
    json j = json::array();
    for (const auto& item : items) {
        j.push_back(item_to_json(item));
    }
    return dump(j);
}

Result<std::vector<ClipboardItem>> decode_history(const std::string& data) {
    auto parsed = parse(data, "clipboard history");
    if (!parsed.ok()) {
        return parsed.error();
    }
    return decode_array<ClipboardItem>(*parsed, "Clipboard history", item_from_json);
}

std::string encode_pinned(const std::vector<PinnedItem>& pinned) {
    json j = json::array();
    for (const auto& p : pinned) {
        j.push_back(pinned_to_json(p));
    }
    return dump(j);
}

Result<std::vector<PinnedItem>> decode_pinned(const std::string& data) {
    auto parsed = parse(data, "pinned items");
    if (!parsed.ok()) {
        return parsed.error();
    }
    return decode_array<PinnedItem>(*parsed, "Pinned items", pinned_from_json);
}

std::string encode_snippets(const std::vector<Snippet>& snippets) {
    json j = json::array();
    for (const auto& s : snippets) {
        j.push_back(snippet_to_json(s));
    }
    return dump(j);
}

Result<std::vector<Snippet>> decode_snippets(const std::string& data) {
    auto parsed = parse(data, "snippets");
    if (!parsed.ok()) {
        return parsed.error();
    }
    return decode_array<Snippet>(*parsed, "Snippets", snippet_from_json);
}

std::string encode_settings(const Settings& settings) {
    return settings_to_json(settings).dump(2, ' ', false, json::error_handler_t::replace);
}

Result<Settings> decode_settings(const std::string& data) {
    auto parsed = parse(data, "settings");
    if (!parsed.ok()) {
        return parsed.error();
    }
    return settings_from_json(*parsed);
}

std::string encode_backup(const BackupPayload& payload) {
    json history = json::array();
    for (const auto& item : payload.history) {
        history.push_back(item_to_json(item));
    }
    json pinned = json::array();
    for (const auto& p : payload.pinned) {
        pinned.push_back(pinned_to_json(p));
    }

    json j;
    j["version"] = payload.version;
    j["history"] = std::move(history);
    j["pinned"] = std::move(pinned);
    return dump(j);
}

Result<BackupPayload> decode_backup(const std::string& data) {
    auto parsed = parse(data, "backup");
    if (!parsed.ok()) {
        return Error(ErrorCode::DATA_FORMAT_INVALID, parsed.error().message());
    }
    const json& j = *parsed;

    try {
        if (!j.is_object()) {
            return Error(ErrorCode::DATA_FORMAT_INVALID, "Backup is not a JSON object");
        }

        BackupPayload payload;
        payload.version = j.at("version").get<int>();

        auto history = decode_array<ClipboardItem>(
            j.value("history", json::array()), "Backup history", item_from_json);
        if (!history.ok()) {
            return history.error();
        }
        auto pinned = decode_array<PinnedItem>(
            j.value("pinned", json::array()), "Backup pinned items", pinned_from_json);
        if (!pinned.ok()) {
            return pinned.error();
        }

        payload.history = std::move(history).value();
        payload.pinned = std::move(pinned).value();
        return payload;
    } catch (const json::exception& e) {
        return Error(ErrorCode::DATA_FORMAT_INVALID,
                     std::string("Invalid backup: ") + e.what());
    }
}

}  // namespace storage
}  // namespace clipstash
