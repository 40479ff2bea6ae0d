#pragma once

#include <clipstash/auto_paste_service.hpp>
#include <clipstash/cancellation.hpp>
#include <clipstash/clipboard_store.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace clipstash {

/**
 * QuickActions - One-shot transformations of a single clipboard item.
 *
 * Each transformation returns the item it produced and, when a clipboard
 * writer is configured, places that item on the clipboard. Source items
 * are never modified.
 */
class QuickActions {
public:
    QuickActions(ClipboardStore& store,
                 std::shared_ptr<AutoPasteService> auto_paste = nullptr,
                 std::shared_ptr<Logger> logger = nullptr);

    /**
     * Write the item's content to a file: text as UTF-8, rich text as RTF
     * when present, images as their bytes, files by copying the source.
     *
     * @return NOT_FOUND when a file item's source is missing,
     *         STORAGE_WRITE_FAILED when the destination cannot be written
     */
    Result<void> save_to_file(const ClipboardItem& item,
                              const std::filesystem::path& destination,
                              const CancellationToken& token = {});

    // Base64 of the text, or of the image bytes for images
    Result<ClipboardItem> copy_as_base64(const ClipboardItem& item,
                                         const CancellationToken& token = {});

    Result<ClipboardItem> url_encode(const ClipboardItem& item,
                                     const CancellationToken& token = {});

    // DATA_FORMAT_INVALID on a malformed percent escape
    Result<ClipboardItem> url_decode(const ClipboardItem& item,
                                     const CancellationToken& token = {});

    /**
     * Capture edited text as a new history item of the source's type
     * (rich text becomes plain text).
     */
    Result<ClipboardItem> edit_text(const ClipboardItem& source,
                                    const std::string& edited_text,
                                    const CancellationToken& token = {});

    /**
     * Default file name for save_to_file, e.g. "clipboard-20260131-140509.txt"
     * for text or the source file name for file items.
     */
    static std::string suggested_file_name(const ClipboardItem& item);

private:
    Result<ClipboardItem> deliver(ClipboardItem output);

    ClipboardStore& store_;
    std::shared_ptr<AutoPasteService> auto_paste_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace clipstash
