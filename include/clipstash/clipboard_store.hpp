#pragma once

#include <clipstash/auto_paste_service.hpp>
#include <clipstash/cancellation.hpp>
#include <clipstash/clipboard_item.hpp>
#include <clipstash/clipboard_monitor.hpp>
#include <clipstash/flush_worker.hpp>
#include <clipstash/result.hpp>
#include <clipstash/settings.hpp>
#include <clipstash/snippet.hpp>
#include <clipstash/storage/repository.hpp>
#include <clipstash/types.hpp>
#include <clipstash/util/logger.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clipstash {

using SubscriptionId = uint64_t;
using StateObserver = std::function<void()>;

/**
 * ClipboardStore - Clipboard state and retention engine.
 *
 * Owns the canonical history (most recent first), the pinned list, the
 * snippets and the current settings. Every mutation is serialized by a
 * single mutex and publishes a new immutable state; readers copy a
 * shared pointer and never observe a partial update. Persistence runs
 * on a background FlushWorker.
 *
 * Usage:
 *   auto store = ClipboardStore::open(config);
 *   if (!store.ok()) { handle error }
 *
 *   auto item = ClipboardItem::make_text("hello");
 *   store.value()->add_item(item);
 *   auto history = store.value()->history();
 */
class ClipboardStore {
public:
    struct Dependencies {
        std::shared_ptr<HistoryRepository> history_repository;
        std::shared_ptr<PinnedRepository> pinned_repository;
        std::shared_ptr<SnippetRepository> snippet_repository;
        std::shared_ptr<SettingsRepository> settings_repository;
        std::shared_ptr<ClipboardMonitor> monitor;          // optional
        std::shared_ptr<AutoPasteService> auto_paste;       // optional
        std::shared_ptr<Logger> logger;                     // NullLogger when empty
        size_t max_persisted_image_bytes = limits::MAX_PERSISTED_IMAGE_BYTES;
        FlushWorker::Duration flush_coalesce_delay = FlushWorker::Duration(0);
    };

    /**
     * Open a store rooted at config.root_directory with the file
     * repositories and AES-GCM history encryption, then initialize it.
     *
     * @param monitor Optional capture source for start_runtime()
     * @param auto_paste Optional clipboard writer for select/copy/paste
     */
    static Result<std::unique_ptr<ClipboardStore>> open(
        const Config& config,
        std::shared_ptr<ClipboardMonitor> monitor = nullptr,
        std::shared_ptr<AutoPasteService> auto_paste = nullptr);

    explicit ClipboardStore(Dependencies deps);

    // Stops the runtime, then drains pending flushes
    ~ClipboardStore();

    ClipboardStore(const ClipboardStore&) = delete;
    ClipboardStore& operator=(const ClipboardStore&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Load settings, history, pinned items and snippets.
     *
     * Storage I/O failures abort with STATE_INITIALIZATION_FAILED. A corrupt
     * or undecryptable aggregate starts empty and is reported in
     * InitializationReport::warnings. Calling it again is a no-op.
     */
    Result<InitializationReport> initialize(const CancellationToken& token = {});

    bool is_initialized() const;

    /**
     * Subscribe the monitor so captures flow into add_item().
     * A second call while running is a no-op.
     */
    Result<void> start_runtime(const CancellationToken& token = {});
    Result<void> stop_runtime(const CancellationToken& token = {});
    bool is_runtime_running() const;

    // ========================================================================
    // Read-only views (consistent snapshots)
    // ========================================================================

    std::shared_ptr<const std::vector<ClipboardItem>> history() const;
    std::shared_ptr<const std::vector<PinnedItem>> pinned() const;
    std::shared_ptr<const std::vector<Snippet>> snippets() const;
    Settings settings() const;

    // Look up an id in history, then among pinned originals
    std::optional<ClipboardItem> find_item(const ItemId& id) const;

    // Item most recently selected, if it still exists
    std::optional<ClipboardItem> active_item() const;

    // Incremented once per committed mutation
    uint64_t generation() const;

    // ========================================================================
    // History
    // ========================================================================

    /**
     * Record a capture.
     *
     * Ignored (successfully) while history is off, in incognito mode or
     * when the source application is excluded. Content equal to the most
     * recent entry refreshes that entry instead of adding a new one.
     *
     * @return CLIPBOARD_IMAGE_TOO_LARGE for images over the persisted limit
     */
    Result<void> add_item(ClipboardItem item, const CancellationToken& token = {});

    /**
     * Remove an item from history along with any pin of it.
     *
     * @return CLIPBOARD_HISTORY_ITEM_NOT_FOUND if neither holds the id
     */
    Result<void> delete_item(const ItemId& id, const CancellationToken& token = {});

    // Pins are kept
    Result<void> clear_history(const CancellationToken& token = {});

    // Mark active, write to the clipboard and auto-paste when enabled
    Result<void> select_item(const ItemId& id, const CancellationToken& token = {});
    Result<void> copy_item(const ItemId& id, const CancellationToken& token = {});
    Result<void> paste_item(const ItemId& id, const CancellationToken& token = {});

    // ========================================================================
    // Pins
    // ========================================================================

    /**
     * Pin a snapshot of an item.
     *
     * @return CLIPBOARD_HISTORY_ITEM_NOT_FOUND, PINNED_ITEM_DUPLICATE or
     *         PINNED_ITEMS_LIMIT_EXCEEDED
     */
    Result<PinnedItem> pin_item(const ItemId& id,
                                std::optional<std::string> custom_title = std::nullopt,
                                const CancellationToken& token = {});

    // id may be the original item id or the pin id
    Result<void> unpin_item(const std::string& id, const CancellationToken& token = {});

    // Returns true when the item ends up pinned
    Result<bool> toggle_pin(const ItemId& id, const CancellationToken& token = {});

    // A blank title clears the custom title
    Result<void> rename_pin(const PinId& pin_id,
                            std::optional<std::string> custom_title,
                            const CancellationToken& token = {});

    // ========================================================================
    // Settings
    // ========================================================================

    /**
     * Validate, persist synchronously, then apply. History is truncated
     * to the new effective limit immediately.
     */
    Result<void> save_settings(Settings settings, const CancellationToken& token = {});

    // ========================================================================
    // Snippets
    // ========================================================================

    Result<Snippet> add_snippet(std::string title,
                                std::string content,
                                std::string category = "",
                                const CancellationToken& token = {});
    Result<void> update_snippet(Snippet snippet, const CancellationToken& token = {});
    Result<void> delete_snippet(const SnippetId& id, const CancellationToken& token = {});

    // Resolve placeholders and record the use time
    Result<std::string> use_snippet(const SnippetId& id,
                                    const std::map<std::string, std::string>& values = {},
                                    const CancellationToken& token = {});

    // ========================================================================
    // Backup support
    // ========================================================================

    // History and pinned items at the current generation
    BackupPayload snapshot() const;

    /**
     * Replace history and pinned items, on disk first, then in memory.
     * Any failure leaves both untouched.
     */
    Result<void> restore(BackupPayload payload, const CancellationToken& token = {});

    // ========================================================================
    // Observers and persistence
    // ========================================================================

    SubscriptionId subscribe(StateObserver observer);
    void unsubscribe(SubscriptionId id);

    /**
     * Wait for every scheduled write.
     *
     * @return The last flush error, if any
     */
    Result<void> flush();

    size_t max_persisted_image_bytes() const { return max_image_bytes_; }

private:
    struct StoreState {
        std::shared_ptr<const std::vector<ClipboardItem>> history;
        std::shared_ptr<const std::vector<PinnedItem>> pinned;
        std::shared_ptr<const std::vector<Snippet>> snippets;
        std::shared_ptr<const Settings> settings;
        std::optional<ItemId> active_id;
    };

    using StatePtr = std::shared_ptr<const StoreState>;

    StatePtr current() const;

    // Caller holds mutation_mutex_
    void publish(std::shared_ptr<StoreState> next, uint32_t flush_targets);
    FlushSnapshot make_flush_snapshot(const StoreState& state, uint64_t generation) const;

    Result<void> require_initialized() const;
    Result<ClipboardItem> resolve(const ItemId& id) const;
    void notify_observers();

    std::shared_ptr<HistoryRepository> history_repo_;
    std::shared_ptr<PinnedRepository> pinned_repo_;
    std::shared_ptr<SnippetRepository> snippet_repo_;
    std::shared_ptr<SettingsRepository> settings_repo_;
    std::shared_ptr<ClipboardMonitor> monitor_;
    std::shared_ptr<AutoPasteService> auto_paste_;
    std::shared_ptr<Logger> logger_;
    size_t max_image_bytes_;

    std::mutex mutation_mutex_;
    mutable std::mutex state_mutex_;
    StatePtr state_;
    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> initialized_{false};

    std::mutex runtime_mutex_;
    std::atomic<bool> runtime_running_{false};

    std::mutex observers_mutex_;
    std::map<SubscriptionId, StateObserver> observers_;
    SubscriptionId next_subscription_id_ = 1;

    std::unique_ptr<FlushWorker> flush_worker_;
};

}  // namespace clipstash
