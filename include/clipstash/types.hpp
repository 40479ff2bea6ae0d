#pragma once

#include <clipstash/clipboard_item.hpp>
#include <clipstash/core_types.hpp>
#include <clipstash/result.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace clipstash {

namespace fs = std::filesystem;

/**
 * Versioned export of history and pinned state.
 */
struct BackupPayload {
    int version = BACKUP_FORMAT_VERSION;
    std::vector<ClipboardItem> history;
    std::vector<PinnedItem> pinned;
};

/**
 * Configuration for opening a ClipboardStore.
 */
struct Config {
    fs::path root_directory;
    bool verbose = false;
    fs::path log_file;          // Empty disables file logging
    size_t max_persisted_image_bytes = limits::MAX_PERSISTED_IMAGE_BYTES;
};

/**
 * Outcome of ClipboardStore::initialize. Recoverable per-aggregate load
 * failures are collected here instead of failing startup.
 */
struct InitializationReport {
    size_t history_count = 0;
    size_t pinned_count = 0;
    size_t snippet_count = 0;
    std::vector<Error> warnings;
};

}  // namespace clipstash
