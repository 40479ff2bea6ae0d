#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace clipstash {

// Item, pin and snippet identifiers are UUID v4 strings
using ItemId = std::string;
using PinId = std::string;
using SnippetId = std::string;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

namespace limits {

constexpr size_t MAX_HISTORY_ITEMS_HARD_LIMIT = 500;
constexpr size_t MIN_HISTORY_ITEMS = 10;
constexpr size_t MAX_PINNED_ITEMS = 50;
constexpr size_t MAX_SNIPPETS = 200;
constexpr size_t MAX_PERSISTED_IMAGE_BYTES = 1048576;

// Range accepted by Settings::validate for the configured history cap
constexpr int MAX_HISTORY_ITEMS_SETTING = 10000;

}  // namespace limits

// Version written into exported backups; import accepts only this version
constexpr int BACKUP_FORMAT_VERSION = 1;

enum class ItemType : uint8_t {
    TEXT,
    IMAGE,
    COLOR,
    CODE,
    URL,
    EMAIL,
    PHONE,
    JSON,
    FILE,
    RICH_TEXT
};

// Text, Color, Code, Url, Email, Phone and Json all carry a plain text payload
inline bool is_text_family(ItemType type) {
    switch (type) {
        case ItemType::TEXT:
        case ItemType::COLOR:
        case ItemType::CODE:
        case ItemType::URL:
        case ItemType::EMAIL:
        case ItemType::PHONE:
        case ItemType::JSON:
            return true;
        default:
            return false;
    }
}

const char* item_type_name(ItemType type);
std::optional<ItemType> parse_item_type(const std::string& name);

// Millisecond precision is what survives persistence
int64_t to_epoch_millis(Timestamp tp);
Timestamp from_epoch_millis(int64_t millis);
Timestamp now_millis();

}  // namespace clipstash
