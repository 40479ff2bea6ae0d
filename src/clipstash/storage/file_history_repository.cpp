#include <clipstash/storage/file_repositories.hpp>
#include <clipstash/storage/file_util.hpp>
#include <clipstash/storage/json_codec.hpp>

#include <algorithm>
#include <cctype>

namespace clipstash {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

FileHistoryRepository::FileHistoryRepository(StoragePaths paths,
                                             std::shared_ptr<EncryptionService> encryption,
                                             std::shared_ptr<Logger> logger,
                                             size_t max_image_bytes)
    : paths_(std::move(paths))
    , encryption_(std::move(encryption))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
    , max_image_bytes_(max_image_bytes)
{}

std::vector<ClipboardItem> FileHistoryRepository::filter(
        const std::vector<ClipboardItem>& items) const {
    std::vector<ClipboardItem> out;
    out.reserve(std::min(items.size(), limits::MAX_HISTORY_ITEMS_HARD_LIMIT));
    for (const auto& item : items) {
        if (out.size() >= limits::MAX_HISTORY_ITEMS_HARD_LIMIT) {
            break;
        }
        const std::string* bytes = item.image_bytes();
        if (bytes && bytes->size() > max_image_bytes_) {
            continue;
        }
        out.push_back(item);
    }
    return out;
}

Result<std::vector<ClipboardItem>> FileHistoryRepository::load(bool encrypted) {
    const auto& preferred = encrypted ? paths_.history_encrypted : paths_.history_json;
    const auto& fallback = encrypted ? paths_.history_json : paths_.history_encrypted;

    auto data = storage::read_file(preferred);
    if (!data.ok()) {
        return data.error();
    }
    bool from_encrypted = encrypted;

    if (!data->has_value()) {
        data = storage::read_file(fallback);
        if (!data.ok()) {
            return data.error();
        }
        if (!data->has_value()) {
            return std::vector<ClipboardItem>();
        }
        from_encrypted = !encrypted;
        logger_->info("History file not found in preferred form, reading " + fallback.string());
    }

    std::string bytes = std::move(**data);
    if (bytes.empty()) {
        return std::vector<ClipboardItem>();
    }

    if (from_encrypted) {
        if (!encryption_) {
            return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                         "History is encrypted but no encryption service is configured");
        }
        auto clear = encryption_->decrypt(bytes);
        if (!clear.ok()) {
            return clear.error();
        }
        bytes = std::move(clear).value();
    }

    if (is_blank(bytes)) {
        return std::vector<ClipboardItem>();
    }

    auto items = storage::decode_history(bytes);
    if (!items.ok()) {
        return items.error();
    }
    return filter(*items);
}

Result<void> FileHistoryRepository::save(const std::vector<ClipboardItem>& items, bool encrypted) {
    const auto& destination = encrypted ? paths_.history_encrypted : paths_.history_json;
    const auto& secondary = encrypted ? paths_.history_json : paths_.history_encrypted;

    std::vector<ClipboardItem> filtered = filter(items);
    std::string data = storage::encode_history(filtered);

    if (encrypted) {
        if (!encryption_) {
            return Error(ErrorCode::ENCRYPTION_KEY_UNAVAILABLE,
                         "Encrypted history requested but no encryption service is configured");
        }
        auto sealed = encryption_->encrypt(data);
        if (!sealed.ok()) {
            return sealed.error();
        }
        data = std::move(sealed).value();
    }

    auto written = storage::write_file_atomic(destination, data);
    if (!written.ok()) {
        return written;
    }

    auto removed = storage::remove_file(secondary);
    if (!removed.ok()) {
        return removed;
    }

    logger_->debug("Saved " + std::to_string(filtered.size()) +
                   " clipboard items to " + destination.string());
    return Ok();
}

Result<void> FileHistoryRepository::clear() {
    for (const auto* path : {&paths_.history_json, &paths_.history_encrypted}) {
        auto removed = storage::remove_file(*path);
        if (!removed.ok()) {
            logger_->error("Failed to clear history: " + removed.error().to_string());
            return removed;
        }
    }
    logger_->info("Removed stored clipboard history");
    return Ok();
}

}  // namespace clipstash
