#pragma once

#include <clipstash/core_types.hpp>
#include <clipstash/result.hpp>

#include <optional>
#include <string>
#include <variant>

namespace clipstash {

struct TextPayload {
    std::string text;
};

// Encoded image bytes as delivered by the platform clipboard
struct ImagePayload {
    std::string bytes;
};

struct FilePayload {
    std::string path;
};

struct RichTextPayload {
    std::string plain_text;
    std::optional<std::string> rtf;
    std::optional<std::string> html;
};

using ItemPayload = std::variant<TextPayload, ImagePayload, FilePayload, RichTextPayload>;

/**
 * Where a capture came from, when the platform can tell.
 */
struct ItemSource {
    std::optional<std::string> app_id;
    std::optional<std::string> executable_path;
};

/**
 * ClipboardItem - Immutable snapshot of one clipboard capture.
 *
 * The payload alternative always matches the item type: text-family
 * types carry TextPayload, IMAGE carries ImagePayload, FILE carries
 * FilePayload and RICH_TEXT carries RichTextPayload.
 */
class ClipboardItem {
public:
    /**
     * Create an item, validating that the payload matches the type.
     *
     * @param id Item identifier (a fresh UUID is generated when empty)
     * @return The item, or CLIPBOARD_ITEM_INVALID
     */
    static Result<ClipboardItem> create(ItemId id,
                                        ItemType type,
                                        Timestamp timestamp,
                                        ItemPayload payload,
                                        ItemSource source = {});

    /**
     * Text item. A non-text-family type is replaced by TEXT.
     */
    static ClipboardItem make_text(std::string text,
                                   ItemType type = ItemType::TEXT,
                                   ItemSource source = {});
    static ClipboardItem make_image(std::string bytes, ItemSource source = {});
    static ClipboardItem make_file(std::string path, ItemSource source = {});
    static ClipboardItem make_rich_text(std::string plain_text,
                                        std::optional<std::string> rtf = std::nullopt,
                                        std::optional<std::string> html = std::nullopt,
                                        ItemSource source = {});

    const ItemId& id() const { return id_; }
    ItemType type() const { return type_; }
    Timestamp timestamp() const { return timestamp_; }
    const ItemSource& source() const { return source_; }
    const ItemPayload& payload() const { return payload_; }

    // Payload accessors; nullptr when the item carries another payload kind
    const std::string* text() const;
    const std::string* image_bytes() const;
    const std::string* file_path() const;
    const RichTextPayload* rich_text() const;

    /**
     * Text representation used by text-oriented actions: the text of a
     * text-family item, the plain text of rich text, or the path of a file.
     */
    std::optional<std::string> text_view() const;

    // Encoded size of the payload in bytes
    size_t payload_size() const;

    /**
     * Content equivalence used for deduplication and pin duplicate checks.
     * Identity and timestamps are ignored.
     */
    bool is_equivalent_content(const ClipboardItem& other) const;

    std::string display_string() const;

    ClipboardItem with_timestamp(Timestamp timestamp) const;
    ClipboardItem with_source(ItemSource source) const;

    bool operator==(const ClipboardItem& other) const;
    bool operator!=(const ClipboardItem& other) const { return !(*this == other); }

private:
    ClipboardItem(ItemId id, ItemType type, Timestamp timestamp,
                  ItemPayload payload, ItemSource source);

    ItemId id_;
    ItemType type_;
    Timestamp timestamp_;
    ItemPayload payload_;
    ItemSource source_;
};

/**
 * PinnedItem - A pinned snapshot of a clipboard item.
 *
 * The snapshot is taken at pin time; later history changes never
 * affect it.
 */
struct PinnedItem {
    PinId id;
    ClipboardItem item;
    Timestamp pinned_at;
    std::optional<std::string> custom_title;

    static PinnedItem create(ClipboardItem item,
                             std::optional<std::string> custom_title = std::nullopt);

    std::string display_title() const;

    bool operator==(const PinnedItem& other) const;
    bool operator!=(const PinnedItem& other) const { return !(*this == other); }
};

}  // namespace clipstash
