#include <clipstash/backup_service.hpp>
#include <clipstash/storage/file_util.hpp>
#include <clipstash/storage/json_codec.hpp>

#include <algorithm>

namespace clipstash {

BackupService::BackupService(ClipboardStore& store, std::shared_ptr<Logger> logger)
    : store_(store)
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
{}

Result<std::string> BackupService::export_backup(const CancellationToken& token) const {
    if (token.is_cancelled()) {
        return Error(ErrorCode::CANCELED, "Export was cancelled");
    }

    BackupPayload payload = store_.snapshot();
    size_t max_bytes = store_.max_persisted_image_bytes();
    payload.history.erase(std::remove_if(payload.history.begin(), payload.history.end(),
        [&](const ClipboardItem& item) {
            const std::string* bytes = item.image_bytes();
            return bytes && bytes->size() > max_bytes;
        }), payload.history.end());

    if (payload.history.size() > limits::MAX_HISTORY_ITEMS_HARD_LIMIT) {
        payload.history.erase(payload.history.begin() + limits::MAX_HISTORY_ITEMS_HARD_LIMIT,
                              payload.history.end());
    }
    if (payload.pinned.size() > limits::MAX_PINNED_ITEMS) {
        payload.pinned.erase(payload.pinned.begin() + limits::MAX_PINNED_ITEMS,
                             payload.pinned.end());
    }

    logger_->info("Exporting backup with " + std::to_string(payload.history.size()) +
                  " history items and " + std::to_string(payload.pinned.size()) +
                  " pinned items");
    return storage::encode_backup(payload);
}

Result<void> BackupService::import_backup(const std::string& data, const CancellationToken& token) {
    auto payload = storage::decode_backup(data);
    if (!payload.ok()) {
        return Error(ErrorCode::DATA_FORMAT_INVALID, payload.error().message());
    }
    if (payload->version != BACKUP_FORMAT_VERSION) {
        return Error(ErrorCode::DATA_FORMAT_INVALID,
                     "Backup version " + std::to_string(payload->version) + " is not supported");
    }

    auto restored = store_.restore(std::move(payload).value(), token);
    if (!restored.ok()) {
        logger_->error("Backup import failed: " + restored.error().to_string());
        return restored;
    }
    return Ok();
}

Result<void> BackupService::export_to_file(const std::filesystem::path& path,
                                           const CancellationToken& token) const {
    auto data = export_backup(token);
    if (!data.ok()) {
        return data.error();
    }
    return storage::write_file_atomic(path, *data);
}

Result<void> BackupService::import_from_file(const std::filesystem::path& path,
                                             const CancellationToken& token) {
    auto data = storage::read_file(path);
    if (!data.ok()) {
        return data.error();
    }
    if (!data->has_value()) {
        return Error(ErrorCode::NOT_FOUND, "Backup file " + path.string() + " does not exist");
    }
    return import_backup(**data, token);
}

}  // namespace clipstash
