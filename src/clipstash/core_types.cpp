#include <clipstash/core_types.hpp>

#include <algorithm>
#include <cctype>

namespace clipstash {

namespace {

struct TypeName {
    ItemType type;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {ItemType::TEXT, "text"},
    {ItemType::IMAGE, "image"},
    {ItemType::COLOR, "color"},
    {ItemType::CODE, "code"},
    {ItemType::URL, "url"},
    {ItemType::EMAIL, "email"},
    {ItemType::PHONE, "phone"},
    {ItemType::JSON, "json"},
    {ItemType::FILE, "file"},
    {ItemType::RICH_TEXT, "rich_text"},
};

}  // namespace

const char* item_type_name(ItemType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

std::optional<ItemType> parse_item_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return std::tolower(c); });

    for (const auto& entry : TYPE_NAMES) {
        if (lower == entry.name) return entry.type;
    }
    if (lower == "richtext") return ItemType::RICH_TEXT;
    return std::nullopt;
}

int64_t to_epoch_millis(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

Timestamp from_epoch_millis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(millis)));
}

Timestamp now_millis() {
    return from_epoch_millis(to_epoch_millis(Clock::now()));
}

}  // namespace clipstash
