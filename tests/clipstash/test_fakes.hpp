#pragma once

#include <clipstash/auto_paste_service.hpp>
#include <clipstash/clipboard_monitor.hpp>
#include <clipstash/storage/repository.hpp>

#include <mutex>
#include <optional>
#include <vector>

namespace clipstash::test {

/**
 * In-memory repositories with switchable failures. Saves may arrive
 * from the flush thread, so every member is guarded.
 */
class MemoryHistoryRepository : public HistoryRepository {
public:
    Result<std::vector<ClipboardItem>> load(bool /* encrypted */) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (load_error) return *load_error;
        return items;
    }

    Result<void> save(const std::vector<ClipboardItem>& list, bool encrypted) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++save_count;
        if (fail_saves) {
            return Error(ErrorCode::STORAGE_WRITE_FAILED, "history save failed");
        }
        items = list;
        last_encrypted = encrypted;
        return Ok();
    }

    Result<void> clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++clear_count;
        if (fail_saves) {
            return Error(ErrorCode::STORAGE_DELETE_FAILED, "history clear failed");
        }
        items.clear();
        return Ok();
    }

    int saves() {
        std::lock_guard<std::mutex> lock(mutex_);
        return save_count;
    }

    std::vector<ClipboardItem> stored() {
        std::lock_guard<std::mutex> lock(mutex_);
        return items;
    }

    void set_fail_saves(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_saves = fail;
    }

    std::mutex mutex_;
    std::vector<ClipboardItem> items;
    std::optional<Error> load_error;
    bool fail_saves = false;
    bool last_encrypted = false;
    int save_count = 0;
    int clear_count = 0;
};

class MemoryPinnedRepository : public PinnedRepository {
public:
    Result<std::vector<PinnedItem>> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (load_error) return *load_error;
        return items;
    }

    Result<void> save(const std::vector<PinnedItem>& list) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_saves) {
            return Error(ErrorCode::STORAGE_WRITE_FAILED, "pinned save failed");
        }
        items = list;
        return Ok();
    }

    Result<void> clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        items.clear();
        return Ok();
    }

    std::vector<PinnedItem> stored() {
        std::lock_guard<std::mutex> lock(mutex_);
        return items;
    }

    void set_fail_saves(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_saves = fail;
    }

    std::mutex mutex_;
    std::vector<PinnedItem> items;
    std::optional<Error> load_error;
    bool fail_saves = false;
};

class MemorySnippetRepository : public SnippetRepository {
public:
    Result<std::vector<Snippet>> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (load_error) return *load_error;
        return items;
    }

    Result<void> save(const std::vector<Snippet>& list) override {
        std::lock_guard<std::mutex> lock(mutex_);
        items = list;
        return Ok();
    }

    Result<void> clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        items.clear();
        return Ok();
    }

    std::vector<Snippet> stored() {
        std::lock_guard<std::mutex> lock(mutex_);
        return items;
    }

    std::mutex mutex_;
    std::vector<Snippet> items;
    std::optional<Error> load_error;
};

class MemorySettingsRepository : public SettingsRepository {
public:
    Result<Settings> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (load_error) return *load_error;
        return settings;
    }

    Result<void> save(const Settings& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_saves) {
            return Error(ErrorCode::STORAGE_WRITE_FAILED, "settings save failed");
        }
        settings = value;
        ++save_count;
        return Ok();
    }

    Result<void> clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings = Settings();
        return Ok();
    }

    std::mutex mutex_;
    Settings settings;
    std::optional<Error> load_error;
    bool fail_saves = false;
    int save_count = 0;
};

/**
 * Monitor driven by the test: emit() runs the registered callback on
 * the calling thread.
 */
class FakeClipboardMonitor : public ClipboardMonitor {
public:
    Result<void> start(CaptureCallback cb, bool capture_rich_text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_start) {
            return Error(ErrorCode::UNKNOWN_ERROR, "no clipboard access");
        }
        callback = std::move(cb);
        rich_text = capture_rich_text;
        ++start_count;
        return Ok();
    }

    Result<void> update_capture_rich_text(bool capture_rich_text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        rich_text = capture_rich_text;
        return Ok();
    }

    Result<void> stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = nullptr;
        ++stop_count;
        return Ok();
    }

    Result<void> emit(ClipboardItem item) {
        CaptureCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cb = callback;
        }
        if (!cb) {
            return Error(ErrorCode::INVALID_OPERATION, "monitor is not running");
        }
        return cb(std::move(item));
    }

    std::mutex mutex_;
    CaptureCallback callback;
    bool rich_text = false;
    bool fail_start = false;
    int start_count = 0;
    int stop_count = 0;
};

class FakeAutoPasteService : public AutoPasteService {
public:
    Result<void> set_clipboard_content(const ClipboardItem& item) override {
        std::lock_guard<std::mutex> lock(mutex_);
        written.push_back(item);
        return Ok();
    }

    Result<void> paste_to_previous_window() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++paste_count;
        return Ok();
    }

    std::mutex mutex_;
    std::vector<ClipboardItem> written;
    int paste_count = 0;
};

// Items with distinct, strictly increasing timestamps
inline ClipboardItem text_item(const std::string& text, int64_t millis) {
    return ClipboardItem::make_text(text).with_timestamp(from_epoch_millis(millis));
}

}  // namespace clipstash::test
