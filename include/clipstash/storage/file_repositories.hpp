#pragma once

#include <clipstash/security/encryption_service.hpp>
#include <clipstash/storage/repository.hpp>
#include <clipstash/storage/storage_paths.hpp>
#include <clipstash/util/logger.hpp>

#include <memory>

namespace clipstash {

/**
 * FileHistoryRepository - history.json or history.json.enc.
 *
 * Lists are capped at the history hard limit and images larger than
 * max_image_bytes are dropped both when loading and when saving.
 */
class FileHistoryRepository : public HistoryRepository {
public:
    FileHistoryRepository(StoragePaths paths,
                          std::shared_ptr<EncryptionService> encryption,
                          std::shared_ptr<Logger> logger,
                          size_t max_image_bytes = limits::MAX_PERSISTED_IMAGE_BYTES);

    Result<std::vector<ClipboardItem>> load(bool encrypted) override;
    Result<void> save(const std::vector<ClipboardItem>& items, bool encrypted) override;
    Result<void> clear() override;

private:
    std::vector<ClipboardItem> filter(const std::vector<ClipboardItem>& items) const;

    StoragePaths paths_;
    std::shared_ptr<EncryptionService> encryption_;
    std::shared_ptr<Logger> logger_;
    size_t max_image_bytes_;
};

class FilePinnedRepository : public PinnedRepository {
public:
    FilePinnedRepository(StoragePaths paths, std::shared_ptr<Logger> logger);

    Result<std::vector<PinnedItem>> load() override;
    Result<void> save(const std::vector<PinnedItem>& pinned) override;
    Result<void> clear() override;

private:
    StoragePaths paths_;
    std::shared_ptr<Logger> logger_;
};

class FileSnippetRepository : public SnippetRepository {
public:
    FileSnippetRepository(StoragePaths paths, std::shared_ptr<Logger> logger);

    Result<std::vector<Snippet>> load() override;
    Result<void> save(const std::vector<Snippet>& snippets) override;
    Result<void> clear() override;

private:
    StoragePaths paths_;
    std::shared_ptr<Logger> logger_;
};

class FileSettingsRepository : public SettingsRepository {
public:
    FileSettingsRepository(StoragePaths paths, std::shared_ptr<Logger> logger);

    Result<Settings> load() override;
    Result<void> save(const Settings& settings) override;
    Result<void> clear() override;

private:
    StoragePaths paths_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace clipstash
