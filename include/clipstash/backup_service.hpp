#pragma once

#include <clipstash/cancellation.hpp>
#include <clipstash/clipboard_store.hpp>
#include <clipstash/result.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace clipstash {

/**
 * BackupService - Versioned export and atomic import of history and pins.
 */
class BackupService {
public:
    explicit BackupService(ClipboardStore& store, std::shared_ptr<Logger> logger = nullptr);

    /**
     * Serialize history (oversize images dropped) and pinned items as a
     * version 1 JSON document.
     */
    Result<std::string> export_backup(const CancellationToken& token = {}) const;

    /**
     * Replace history and pinned items with the backup's contents.
     *
     * @return DATA_FORMAT_INVALID for malformed JSON, an unsupported
     *         version or an invalid record. State is untouched on failure.
     */
    Result<void> import_backup(const std::string& data, const CancellationToken& token = {});

    Result<void> export_to_file(const std::filesystem::path& path,
                                const CancellationToken& token = {}) const;
    Result<void> import_from_file(const std::filesystem::path& path,
                                  const CancellationToken& token = {});

private:
    ClipboardStore& store_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace clipstash
