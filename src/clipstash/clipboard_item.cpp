#include <clipstash/clipboard_item.hpp>
#include <clipstash/util/uuid.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace clipstash {

namespace {

constexpr size_t MAX_DISPLAY_LENGTH = 100;

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool payload_matches(ItemType type, const ItemPayload& payload) {
    if (is_text_family(type)) {
        return std::holds_alternative<TextPayload>(payload);
    }
    switch (type) {
        case ItemType::IMAGE: return std::holds_alternative<ImagePayload>(payload);
        case ItemType::FILE: return std::holds_alternative<FilePayload>(payload);
        case ItemType::RICH_TEXT: return std::holds_alternative<RichTextPayload>(payload);
        default: return false;
    }
}

}  // namespace

ClipboardItem::ClipboardItem(ItemId id, ItemType type, Timestamp timestamp,
                             ItemPayload payload, ItemSource source)
    : id_(std::move(id))
    , type_(type)
    , timestamp_(timestamp)
    , payload_(std::move(payload))
    , source_(std::move(source))
{}

Result<ClipboardItem> ClipboardItem::create(ItemId id,
                                            ItemType type,
                                            Timestamp timestamp,
                                            ItemPayload payload,
                                            ItemSource source) {
    if (!payload_matches(type, payload)) {
        return Error(ErrorCode::CLIPBOARD_ITEM_INVALID,
                     std::string("Payload does not match item type '") +
                     item_type_name(type) + "'");
    }
    if (id.empty()) {
        id = generate_uuid();
    }
    return ClipboardItem(std::move(id), type, timestamp, std::move(payload), std::move(source));
}

ClipboardItem ClipboardItem::make_text(std::string text, ItemType type, ItemSource source) {
    if (!is_text_family(type)) {
        type = ItemType::TEXT;
    }
    return ClipboardItem(generate_uuid(), type, now_millis(),
                         TextPayload{std::move(text)}, std::move(source));
}

ClipboardItem ClipboardItem::make_image(std::string bytes, ItemSource source) {
    return ClipboardItem(generate_uuid(), ItemType::IMAGE, now_millis(),
                         ImagePayload{std::move(bytes)}, std::move(source));
}

ClipboardItem ClipboardItem::make_file(std::string path, ItemSource source) {
    return ClipboardItem(generate_uuid(), ItemType::FILE, now_millis(),
                         FilePayload{std::move(path)}, std::move(source));
}

ClipboardItem ClipboardItem::make_rich_text(std::string plain_text,
                                            std::optional<std::string> rtf,
                                            std::optional<std::string> html,
                                            ItemSource source) {
    return ClipboardItem(generate_uuid(), ItemType::RICH_TEXT, now_millis(),
                         RichTextPayload{std::move(plain_text), std::move(rtf), std::move(html)},
                         std::move(source));
}

const std::string* ClipboardItem::text() const {
    const auto* p = std::get_if<TextPayload>(&payload_);
    return p ? &p->text : nullptr;
}

const std::string* ClipboardItem::image_bytes() const {
    const auto* p = std::get_if<ImagePayload>(&payload_);
    return p ? &p->bytes : nullptr;
}

const std::string* ClipboardItem::file_path() const {
    const auto* p = std::get_if<FilePayload>(&payload_);
    return p ? &p->path : nullptr;
}

const RichTextPayload* ClipboardItem::rich_text() const {
    return std::get_if<RichTextPayload>(&payload_);
}

std::optional<std::string> ClipboardItem::text_view() const {
    if (const auto* t = text()) return *t;
    if (const auto* r = rich_text()) return r->plain_text;
    if (const auto* f = file_path()) return *f;
    return std::nullopt;
}

size_t ClipboardItem::payload_size() const {
    struct SizeVisitor {
        size_t operator()(const TextPayload& p) const { return p.text.size(); }
        size_t operator()(const ImagePayload& p) const { return p.bytes.size(); }
        size_t operator()(const FilePayload& p) const { return p.path.size(); }
        size_t operator()(const RichTextPayload& p) const {
            return p.plain_text.size() +
                   (p.rtf ? p.rtf->size() : 0) +
                   (p.html ? p.html->size() : 0);
        }
    };
    return std::visit(SizeVisitor{}, payload_);
}

bool ClipboardItem::is_equivalent_content(const ClipboardItem& other) const {
    if (type_ != other.type_) {
        return false;
    }

    if (is_text_family(type_)) {
        return *text() == *other.text();
    }

    switch (type_) {
        case ItemType::IMAGE:
            return *image_bytes() == *other.image_bytes();
        case ItemType::FILE:
            return equals_ignore_case(*file_path(), *other.file_path());
        case ItemType::RICH_TEXT:
            return rich_text()->plain_text == other.rich_text()->plain_text;
        default:
            return false;
    }
}

std::string ClipboardItem::display_string() const {
    if (const auto* t = text()) {
        if (t->empty() || is_blank(*t)) {
            return "Invalid Text";
        }
        return t->size() > MAX_DISPLAY_LENGTH ? t->substr(0, MAX_DISPLAY_LENGTH) : *t;
    }

    switch (type_) {
        case ItemType::IMAGE:
            return "Image";
        case ItemType::FILE: {
            const std::string& path = *file_path();
            if (path.empty() || is_blank(path)) {
                return "File";
            }
            std::string name = std::filesystem::path(path).filename().string();
            return name.empty() ? path : name;
        }
        case ItemType::RICH_TEXT: {
            const std::string& plain = rich_text()->plain_text;
            if (plain.empty()) {
                return "Rich Text";
            }
            return plain.size() > MAX_DISPLAY_LENGTH ? plain.substr(0, MAX_DISPLAY_LENGTH) : plain;
        }
        default:
            return "Clipboard Item";
    }
}

ClipboardItem ClipboardItem::with_timestamp(Timestamp timestamp) const {
    ClipboardItem copy = *this;
    copy.timestamp_ = timestamp;
    return copy;
}

ClipboardItem ClipboardItem::with_source(ItemSource source) const {
    ClipboardItem copy = *this;
    copy.source_ = std::move(source);
    return copy;
}

bool ClipboardItem::operator==(const ClipboardItem& other) const {
    if (id_ != other.id_ || type_ != other.type_ || timestamp_ != other.timestamp_) {
        return false;
    }
    if (source_.app_id != other.source_.app_id ||
        source_.executable_path != other.source_.executable_path) {
        return false;
    }
    if (!is_equivalent_content(other)) {
        return false;
    }
    // Equivalence ignores path case and rich-text markup; identity does not
    if (type_ == ItemType::FILE) {
        return *file_path() == *other.file_path();
    }
    if (type_ == ItemType::RICH_TEXT) {
        return rich_text()->rtf == other.rich_text()->rtf &&
               rich_text()->html == other.rich_text()->html;
    }
    return true;
}

// ============================================================================
// PinnedItem
// ============================================================================

PinnedItem PinnedItem::create(ClipboardItem item, std::optional<std::string> custom_title) {
    if (custom_title && is_blank(*custom_title)) {
        custom_title.reset();
    }
    return PinnedItem{generate_uuid(), std::move(item), now_millis(), std::move(custom_title)};
}

std::string PinnedItem::display_title() const {
    if (custom_title && !custom_title->empty() && !is_blank(*custom_title)) {
        return *custom_title;
    }
    return item.display_string();
}

bool PinnedItem::operator==(const PinnedItem& other) const {
    return id == other.id &&
           item == other.item &&
           pinned_at == other.pinned_at &&
           custom_title == other.custom_title;
}

}  // namespace clipstash
