#include <clipstash/quick_actions.hpp>
#include <clipstash/storage/file_util.hpp>
#include <clipstash/util/base64.hpp>
#include <clipstash/util/url_codec.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>

namespace clipstash {

namespace fs = std::filesystem;

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
}

bool is_editable(ItemType type) {
    return is_text_family(type) || type == ItemType::RICH_TEXT;
}

const char* image_extension(const std::string& bytes) {
    if (bytes.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0) return ".png";
    if (bytes.compare(0, 3, "\xFF\xD8\xFF") == 0) return ".jpg";
    if (bytes.compare(0, 4, "GIF8") == 0) return ".gif";
    if (bytes.compare(0, 2, "BM") == 0) return ".bmp";
    return ".bin";
}

Error canceled() {
    return Error(ErrorCode::CANCELED, "Quick action was cancelled");
}

}  // namespace

QuickActions::QuickActions(ClipboardStore& store,
                           std::shared_ptr<AutoPasteService> auto_paste,
                           std::shared_ptr<Logger> logger)
    : store_(store)
    , auto_paste_(std::move(auto_paste))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
{}

Result<ClipboardItem> QuickActions::deliver(ClipboardItem output) {
    if (auto_paste_) {
        auto written = auto_paste_->set_clipboard_content(output);
        if (!written.ok()) {
            return written.error();
        }
    }
    return output;
}

Result<void> QuickActions::save_to_file(const ClipboardItem& item,
                                        const fs::path& destination,
                                        const CancellationToken& token) {
    if (token.is_cancelled()) {
        return canceled();
    }

    auto write = [&](const std::string& data) -> Result<void> {
        auto written = storage::write_file_atomic(destination, data);
        if (!written.ok()) {
            return wrap_error(ErrorCode::STORAGE_WRITE_FAILED,
                              "Save to file failed", written.error());
        }
        logger_->info("Saved " + std::string(item_type_name(item.type())) +
                      " item to " + destination.string());
        return Ok();
    };

    if (const auto* text = item.text()) {
        return write(*text);
    }
    if (const auto* rich = item.rich_text()) {
        if (rich->rtf && !rich->rtf->empty()) {
            return write(*rich->rtf);
        }
        return write(rich->plain_text);
    }
    if (const auto* bytes = item.image_bytes()) {
        if (bytes->empty()) {
            return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE, "Image item has no content");
        }
        return write(*bytes);
    }
    if (const auto* path = item.file_path()) {
        std::error_code ec;
        if (is_blank(*path) || !fs::is_regular_file(*path, ec)) {
            return Error(ErrorCode::NOT_FOUND, "Source file '" + *path + "' was not found");
        }
        auto dir = storage::ensure_directory(destination.parent_path());
        if (!dir.ok()) {
            return wrap_error(ErrorCode::STORAGE_WRITE_FAILED, "Save to file failed", dir.error());
        }
        fs::copy_file(*path, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error(ErrorCode::STORAGE_WRITE_FAILED,
                         "Cannot copy to " + destination.string() + ": " + ec.message());
        }
        return Ok();
    }
    return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE,
                 "Item type is not supported for save to file");
}

Result<ClipboardItem> QuickActions::copy_as_base64(const ClipboardItem& item,
                                                   const CancellationToken& token) {
    if (token.is_cancelled()) {
        return canceled();
    }

    std::string encoded;
    auto text = item.text_view();
    if (text && !is_blank(*text)) {
        encoded = base64_encode(*text);
    } else if (item.image_bytes() && !item.image_bytes()->empty()) {
        encoded = base64_encode(*item.image_bytes());
    } else {
        return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE,
                     "Item cannot be converted to base64");
    }

    return deliver(ClipboardItem::make_text(std::move(encoded)));
}

Result<ClipboardItem> QuickActions::url_encode(const ClipboardItem& item,
                                               const CancellationToken& token) {
    if (token.is_cancelled()) {
        return canceled();
    }
    auto text = item.text_view();
    if (!text || is_blank(*text)) {
        return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE,
                     "URL encoding requires a text item");
    }
    return deliver(ClipboardItem::make_text(clipstash::url_encode(*text)));
}

Result<ClipboardItem> QuickActions::url_decode(const ClipboardItem& item,
                                               const CancellationToken& token) {
    if (token.is_cancelled()) {
        return canceled();
    }
    auto text = item.text_view();
    if (!text || is_blank(*text)) {
        return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE,
                     "URL decoding requires a text item");
    }
    auto decoded = clipstash::url_decode(*text);
    if (!decoded) {
        return Error(ErrorCode::DATA_FORMAT_INVALID, "Malformed percent-encoding");
    }
    return deliver(ClipboardItem::make_text(std::move(*decoded)));
}

Result<ClipboardItem> QuickActions::edit_text(const ClipboardItem& source,
                                              const std::string& edited_text,
                                              const CancellationToken& token) {
    if (!is_editable(source.type())) {
        return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE,
                     "Edit supports only text items");
    }
    if (token.is_cancelled()) {
        return canceled();
    }

    ItemType type = source.type() == ItemType::RICH_TEXT ? ItemType::TEXT : source.type();
    ClipboardItem output = ClipboardItem::make_text(edited_text, type);

    auto added = store_.add_item(output, token);
    if (!added.ok()) {
        return added.error();
    }
    return deliver(std::move(output));
}

std::string QuickActions::suggested_file_name(const ClipboardItem& item) {
    if (const auto* path = item.file_path()) {
        std::string name = fs::path(*path).filename().string();
        if (!name.empty() && !is_blank(name)) {
            return name;
        }
    }

    std::time_t t = Clock::to_time_t(item.timestamp());
    std::tm local{};
    localtime_r(&t, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);

    std::string extension = ".txt";
    if (const auto* bytes = item.image_bytes()) {
        extension = image_extension(*bytes);
    } else if (const auto* rich = item.rich_text()) {
        if (rich->rtf && !rich->rtf->empty()) extension = ".rtf";
    } else if (item.file_path()) {
        extension = ".bin";
    }
    return std::string("clipboard-") + stamp + extension;
}

}  // namespace clipstash
