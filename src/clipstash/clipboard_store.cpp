#include <clipstash/clipboard_store.hpp>
#include <clipstash/security/aes_gcm_encryption_service.hpp>
#include <clipstash/storage/file_repositories.hpp>
#include <clipstash/storage/file_util.hpp>

#include <algorithm>
#include <cctype>

namespace clipstash {

namespace {

using HistoryList = std::vector<ClipboardItem>;
using PinnedList = std::vector<PinnedItem>;
using SnippetList = std::vector<Snippet>;

// Failures that only mean one aggregate's content is unreadable
bool is_recoverable_load_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::DESERIALIZATION_FAILED:
        case ErrorCode::DATA_FORMAT_INVALID:
        case ErrorCode::DECRYPTION_FAILED:
        case ErrorCode::ENCRYPTED_PAYLOAD_INVALID:
        case ErrorCode::SETTINGS_INVALID:
        case ErrorCode::SETTINGS_RANGE_INVALID:
        case ErrorCode::SETTINGS_SHORTCUT_INVALID:
            return true;
        default:
            return false;
    }
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
}

Error canceled() {
    return Error(ErrorCode::CANCELED, "Operation was cancelled");
}

bool image_too_large(const ClipboardItem& item, size_t max_bytes) {
    const std::string* bytes = item.image_bytes();
    return bytes && bytes->size() > max_bytes;
}

void truncate_history(HistoryList& history, size_t limit) {
    if (history.size() > limit) {
        history.erase(history.begin() + static_cast<std::ptrdiff_t>(limit), history.end());
    }
}

bool contains_id(const HistoryList& history, const PinnedList& pinned, const ItemId& id) {
    auto in_history = std::any_of(history.begin(), history.end(),
        [&](const ClipboardItem& item) { return item.id() == id; });
    if (in_history) return true;
    return std::any_of(pinned.begin(), pinned.end(),
        [&](const PinnedItem& p) { return p.item.id() == id; });
}

// Clear the active pointer when its item no longer exists
template<typename State>
void refresh_active(State& state) {
    if (state.active_id && !contains_id(*state.history, *state.pinned, *state.active_id)) {
        state.active_id.reset();
    }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<ClipboardStore>> ClipboardStore::open(
        const Config& config,
        std::shared_ptr<ClipboardMonitor> monitor,
        std::shared_ptr<AutoPasteService> auto_paste) {
    if (config.root_directory.empty()) {
        return Error(ErrorCode::STATE_INITIALIZATION_FAILED, "No root directory configured");
    }

    auto dir = storage::ensure_directory(config.root_directory);
    if (!dir.ok()) {
        return wrap_error(ErrorCode::STATE_INITIALIZATION_FAILED,
                          "Cannot prepare store directory", dir.error());
    }

    std::shared_ptr<Logger> logger;
    if (!config.log_file.empty()) {
        auto file_logger = std::make_shared<FileLogger>(config.log_file);
        if (!file_logger->is_open()) {
            return Error(ErrorCode::STATE_INITIALIZATION_FAILED,
                         "Cannot open log file " + config.log_file.string());
        }
        logger = file_logger;
    } else if (config.verbose) {
        logger = std::make_shared<ConsoleLogger>();
    } else {
        logger = std::make_shared<NullLogger>();
    }
    if (config.verbose) {
        logger->set_min_level(LogLevel::DEBUG);
    }

    StoragePaths paths(config.root_directory);
    auto encryption = std::make_shared<AesGcmEncryptionService>(paths.key_file, logger);

    Dependencies deps;
    deps.history_repository = std::make_shared<FileHistoryRepository>(
        paths, encryption, logger, config.max_persisted_image_bytes);
    deps.pinned_repository = std::make_shared<FilePinnedRepository>(paths, logger);
    deps.snippet_repository = std::make_shared<FileSnippetRepository>(paths, logger);
    deps.settings_repository = std::make_shared<FileSettingsRepository>(paths, logger);
    deps.monitor = std::move(monitor);
    deps.auto_paste = std::move(auto_paste);
    deps.logger = logger;
    deps.max_persisted_image_bytes = config.max_persisted_image_bytes;

    auto store = std::make_unique<ClipboardStore>(std::move(deps));
    auto report = store->initialize();
    if (!report.ok()) {
        return report.error();
    }
    for (const auto& warning : report->warnings) {
        logger->warning("Recovered during initialization: " + warning.to_string());
    }

    logger->info("Clipboard store opened at " + config.root_directory.string());
    return store;
}

ClipboardStore::ClipboardStore(Dependencies deps)
    : history_repo_(std::move(deps.history_repository))
    , pinned_repo_(std::move(deps.pinned_repository))
    , snippet_repo_(std::move(deps.snippet_repository))
    , settings_repo_(std::move(deps.settings_repository))
    , monitor_(std::move(deps.monitor))
    , auto_paste_(std::move(deps.auto_paste))
    , logger_(deps.logger ? std::move(deps.logger) : std::make_shared<NullLogger>())
    , max_image_bytes_(deps.max_persisted_image_bytes)
{
    auto initial = std::make_shared<StoreState>();
    initial->history = std::make_shared<const HistoryList>();
    initial->pinned = std::make_shared<const PinnedList>();
    initial->snippets = std::make_shared<const SnippetList>();
    initial->settings = std::make_shared<const Settings>();
    state_ = initial;

    flush_worker_ = std::make_unique<FlushWorker>(
        history_repo_, pinned_repo_, snippet_repo_, logger_, deps.flush_coalesce_delay);
}

ClipboardStore::~ClipboardStore() {
    auto stopped = stop_runtime();
    if (!stopped.ok()) {
        logger_->error("Failed to stop runtime on shutdown: " + stopped.error().to_string());
    }
    if (flush_worker_) {
        flush_worker_->stop();
        auto flushed = flush_worker_->flush();
        if (!flushed.ok()) {
            logger_->error("Unsaved state at shutdown: " + flushed.error().to_string());
        }
    }
}

// ============================================================================
// Internal helpers
// ============================================================================

ClipboardStore::StatePtr ClipboardStore::current() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

FlushSnapshot ClipboardStore::make_flush_snapshot(const StoreState& state,
                                                  uint64_t generation) const {
    FlushSnapshot snapshot;
    snapshot.generation = generation;
    snapshot.history = state.history;
    snapshot.pinned = state.pinned;
    snapshot.snippets = state.snippets;
    snapshot.encrypt_history = state.settings->encrypt_history;
    snapshot.remember_history = state.settings->remember_history;
    return snapshot;
}

void ClipboardStore::publish(std::shared_ptr<StoreState> next, uint32_t flush_targets) {
    uint64_t generation = generation_.load() + 1;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = next;
        generation_.store(generation);
    }
    if (flush_targets != FLUSH_NONE) {
        flush_worker_->schedule(make_flush_snapshot(*next, generation), flush_targets);
    }
}

Result<void> ClipboardStore::require_initialized() const {
    if (!initialized_.load()) {
        return Error(ErrorCode::INVALID_OPERATION, "Store is not initialized");
    }
    return Ok();
}

Result<ClipboardItem> ClipboardStore::resolve(const ItemId& id) const {
    auto item = find_item(id);
    if (!item) {
        return Error(ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND,
                     "Clipboard item '" + id + "' was not found");
    }
    return *item;
}

void ClipboardStore::notify_observers() {
    std::vector<StateObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers.reserve(observers_.size());
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<InitializationReport> ClipboardStore::initialize(const CancellationToken& token) {
    InitializationReport report;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);

        if (initialized_.load()) {
            auto state = current();
            report.history_count = state->history->size();
            report.pinned_count = state->pinned->size();
            report.snippet_count = state->snippets->size();
            return report;
        }

        // Unreadable storage aborts; unreadable content degrades to empty
        auto recover = [&](const Error& error, const char* what) -> Result<void> {
            if (!is_recoverable_load_error(error.code())) {
                return wrap_error(ErrorCode::STATE_INITIALIZATION_FAILED,
                                  std::string("Failed to load ") + what, error);
            }
            logger_->warning(std::string("Discarding unreadable ") + what + ": " +
                             error.to_string());
            report.warnings.push_back(error);
            return Ok();
        };

        Settings settings;
        if (settings_repo_) {
            auto loaded = settings_repo_->load();
            if (loaded.ok()) {
                auto valid = loaded->validate();
                if (valid.ok()) {
                    settings = std::move(loaded).value();
                } else {
                    auto r = recover(valid.error(), "settings");
                    if (!r.ok()) return r.error();
                }
            } else {
                auto r = recover(loaded.error(), "settings");
                if (!r.ok()) return r.error();
            }
        }

        auto history = std::make_shared<HistoryList>();
        if (settings.remember_history && history_repo_) {
            auto loaded = history_repo_->load(settings.encrypt_history);
            if (loaded.ok()) {
                for (auto& item : *loaded) {
                    if (!image_too_large(item, max_image_bytes_)) {
                        history->push_back(std::move(item));
                    }
                }
                truncate_history(*history, settings.effective_history_limit());
            } else {
                auto r = recover(loaded.error(), "clipboard history");
                if (!r.ok()) return r.error();
            }
        }

        auto pinned = std::make_shared<PinnedList>();
        if (pinned_repo_) {
            auto loaded = pinned_repo_->load();
            if (loaded.ok()) {
                *pinned = std::move(loaded).value();
                if (pinned->size() > limits::MAX_PINNED_ITEMS) {
                    pinned->erase(pinned->begin() + limits::MAX_PINNED_ITEMS, pinned->end());
                }
            } else {
                auto r = recover(loaded.error(), "pinned items");
                if (!r.ok()) return r.error();
            }
        }

        auto snippets = std::make_shared<SnippetList>();
        if (snippet_repo_) {
            auto loaded = snippet_repo_->load();
            if (loaded.ok()) {
                *snippets = std::move(loaded).value();
                if (snippets->size() > limits::MAX_SNIPPETS) {
                    snippets->erase(snippets->begin() + limits::MAX_SNIPPETS, snippets->end());
                }
            } else {
                auto r = recover(loaded.error(), "snippets");
                if (!r.ok()) return r.error();
            }
        }

        if (token.is_cancelled()) {
            return canceled();
        }

        report.history_count = history->size();
        report.pinned_count = pinned->size();
        report.snippet_count = snippets->size();

        auto next = std::make_shared<StoreState>();
        next->history = std::move(history);
        next->pinned = std::move(pinned);
        next->snippets = std::move(snippets);
        next->settings = std::make_shared<const Settings>(std::move(settings));
        publish(std::move(next), FLUSH_NONE);
        initialized_.store(true);

        logger_->info("Initialized with " + std::to_string(report.history_count) +
                      " history items, " + std::to_string(report.pinned_count) +
                      " pinned items and " + std::to_string(report.snippet_count) +
                      " snippets");
    }

    notify_observers();
    return report;
}

bool ClipboardStore::is_initialized() const {
    return initialized_.load();
}

Result<void> ClipboardStore::start_runtime(const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(runtime_mutex_);
    if (runtime_running_.load()) {
        return Ok();
    }
    if (!initialized_.load()) {
        return Error(ErrorCode::STATE_INITIALIZATION_FAILED,
                     "Runtime cannot start before the store is initialized");
    }
    if (!monitor_) {
        return Error(ErrorCode::CLIPBOARD_MONITOR_START_FAILED, "No clipboard monitor configured");
    }
    if (token.is_cancelled()) {
        return canceled();
    }

    bool capture_rich_text = current()->settings->capture_rich_text;
    auto started = monitor_->start(
        [this](ClipboardItem item) { return add_item(std::move(item)); },
        capture_rich_text);
    if (!started.ok()) {
        return wrap_error(ErrorCode::CLIPBOARD_MONITOR_START_FAILED,
                          "Failed to start clipboard monitor", started.error());
    }

    runtime_running_.store(true);
    logger_->info("Clipboard runtime started");
    return Ok();
}

Result<void> ClipboardStore::stop_runtime(const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(runtime_mutex_);
    if (!runtime_running_.load()) {
        return Ok();
    }
    if (token.is_cancelled()) {
        return canceled();
    }

    auto stopped = monitor_->stop();
    if (!stopped.ok()) {
        return wrap_error(ErrorCode::RUNTIME_STOP_FAILED,
                          "Failed to stop clipboard monitor", stopped.error());
    }

    runtime_running_.store(false);
    logger_->info("Clipboard runtime stopped");
    return Ok();
}

bool ClipboardStore::is_runtime_running() const {
    return runtime_running_.load();
}

// ============================================================================
// Views
// ============================================================================

std::shared_ptr<const std::vector<ClipboardItem>> ClipboardStore::history() const {
    return current()->history;
}

std::shared_ptr<const std::vector<PinnedItem>> ClipboardStore::pinned() const {
    return current()->pinned;
}

std::shared_ptr<const std::vector<Snippet>> ClipboardStore::snippets() const {
    return current()->snippets;
}

Settings ClipboardStore::settings() const {
    return *current()->settings;
}

std::optional<ClipboardItem> ClipboardStore::find_item(const ItemId& id) const {
    auto state = current();
    for (const auto& item : *state->history) {
        if (item.id() == id) return item;
    }
    for (const auto& p : *state->pinned) {
        if (p.item.id() == id) return p.item;
    }
    return std::nullopt;
}

std::optional<ClipboardItem> ClipboardStore::active_item() const {
    auto state = current();
    if (!state->active_id) {
        return std::nullopt;
    }
    return find_item(*state->active_id);
}

uint64_t ClipboardStore::generation() const {
    return generation_.load();
}

// ============================================================================
// History
// ============================================================================

Result<void> ClipboardStore::add_item(ClipboardItem item, const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        auto state = current();
        const Settings& settings = *state->settings;

        if (!settings.remember_history || settings.incognito_mode) {
            logger_->debug("Capture ignored: history recording is off");
            return Ok();
        }
        if (settings.is_excluded_source(item.source().app_id)) {
            logger_->debug("Capture ignored: source '" + *item.source().app_id + "' is excluded");
            return Ok();
        }
        if (image_too_large(item, max_image_bytes_)) {
            return Error(ErrorCode::CLIPBOARD_IMAGE_TOO_LARGE,
                         "Image of " + std::to_string(item.image_bytes()->size()) +
                         " bytes exceeds the " + std::to_string(max_image_bytes_) + " byte limit");
        }

        auto history = std::make_shared<HistoryList>(*state->history);
        if (!history->empty() && history->front().is_equivalent_content(item)) {
            history->front() = history->front()
                .with_timestamp(item.timestamp())
                .with_source(item.source());
        } else {
            history->insert(history->begin(), std::move(item));
            truncate_history(*history, settings.effective_history_limit());
        }

        if (token.is_cancelled()) {
            return canceled();
        }

        auto next = std::make_shared<StoreState>(*state);
        next->history = std::move(history);
        refresh_active(*next);
        publish(std::move(next), FLUSH_HISTORY);
    }

    notify_observers();
    return Ok();
}

Result<void> ClipboardStore::delete_item(const ItemId& id, const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        auto state = current();
        auto history = std::make_shared<HistoryList>(*state->history);
        auto pinned = std::make_shared<PinnedList>(*state->pinned);

        size_t history_before = history->size();
        history->erase(std::remove_if(history->begin(), history->end(),
            [&](const ClipboardItem& item) { return item.id() == id; }), history->end());

        size_t pinned_before = pinned->size();
        pinned->erase(std::remove_if(pinned->begin(), pinned->end(),
            [&](const PinnedItem& p) { return p.item.id() == id; }), pinned->end());

        uint32_t targets = FLUSH_NONE;
        if (history->size() != history_before) targets |= FLUSH_HISTORY;
        if (pinned->size() != pinned_before) targets |= FLUSH_PINNED;

        if (targets == FLUSH_NONE) {
            return Error(ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND,
                         "Clipboard item '" + id + "' was not found");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        auto next = std::make_shared<StoreState>(*state);
        next->history = std::move(history);
        next->pinned = std::move(pinned);
        refresh_active(*next);
        publish(std::move(next), targets);
    }

    notify_observers();
    return Ok();
}

Result<void> ClipboardStore::clear_history(const CancellationToken& token) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        if (token.is_cancelled()) {
            return canceled();
        }

        // Stored history may exist even when nothing was loaded into memory
        auto state = current();
        changed = !state->history->empty();
        uint64_t generation = generation_.load() + (changed ? 1 : 0);
        auto cleared = flush_worker_->clear_now(FLUSH_HISTORY, generation);
        if (!cleared.ok()) {
            return wrap_error(ErrorCode::STATE_PERSISTENCE_FAILED,
                              "Failed to clear clipboard history", cleared.error());
        }

        if (changed) {
            auto next = std::make_shared<StoreState>(*state);
            next->history = std::make_shared<const HistoryList>();
            refresh_active(*next);
            publish(std::move(next), FLUSH_NONE);
        }
    }

    logger_->info("Clipboard history cleared");
    if (changed) {
        notify_observers();
    }
    return Ok();
}

Result<void> ClipboardStore::select_item(const ItemId& id, const CancellationToken& token) {
    auto item = resolve(id);
    if (!item.ok()) {
        return item.error();
    }
    if (!auto_paste_) {
        return Error(ErrorCode::INVALID_OPERATION, "No clipboard writer configured");
    }
    if (token.is_cancelled()) {
        return canceled();
    }

    auto written = auto_paste_->set_clipboard_content(*item);
    if (!written.ok()) {
        return written;
    }

    bool auto_paste_enabled = false;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto state = current();
        auto_paste_enabled = state->settings->auto_paste_enabled;
        if (contains_id(*state->history, *state->pinned, id)) {
            auto next = std::make_shared<StoreState>(*state);
            next->active_id = id;
            publish(std::move(next), FLUSH_NONE);
        }
    }
    notify_observers();

    if (!auto_paste_enabled) {
        return Ok();
    }
    return auto_paste_->paste_to_previous_window();
}

Result<void> ClipboardStore::copy_item(const ItemId& id, const CancellationToken& token) {
    auto item = resolve(id);
    if (!item.ok()) {
        return item.error();
    }
    if (!auto_paste_) {
        return Error(ErrorCode::INVALID_OPERATION, "No clipboard writer configured");
    }
    if (token.is_cancelled()) {
        return canceled();
    }
    return auto_paste_->set_clipboard_content(*item);
}

Result<void> ClipboardStore::paste_item(const ItemId& id, const CancellationToken& token) {
    auto copied = copy_item(id, token);
    if (!copied.ok()) {
        return copied;
    }
    return auto_paste_->paste_to_previous_window();
}

// ============================================================================
// Pins
// ============================================================================

Result<PinnedItem> ClipboardStore::pin_item(const ItemId& id,
                                            std::optional<std::string> custom_title,
                                            const CancellationToken& token) {
    std::optional<PinnedItem> created;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready.error();

        auto item = resolve(id);
        if (!item.ok()) {
            return item.error();
        }

        auto state = current();
        const PinnedList& pins = *state->pinned;
        bool duplicate = std::any_of(pins.begin(), pins.end(),
            [&](const PinnedItem& p) { return p.item.is_equivalent_content(*item); });
        if (duplicate) {
            return Error(ErrorCode::PINNED_ITEM_DUPLICATE, "Item is already pinned");
        }
        if (pins.size() >= limits::MAX_PINNED_ITEMS) {
            return Error(ErrorCode::PINNED_ITEMS_LIMIT_EXCEEDED,
                         "Cannot pin more than " + std::to_string(limits::MAX_PINNED_ITEMS) +
                         " items");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        created = PinnedItem::create(std::move(item).value(), std::move(custom_title));
        auto pinned = std::make_shared<PinnedList>();
        pinned->reserve(pins.size() + 1);
        pinned->push_back(*created);
        pinned->insert(pinned->end(), pins.begin(), pins.end());

        auto next = std::make_shared<StoreState>(*state);
        next->pinned = std::move(pinned);
        publish(std::move(next), FLUSH_PINNED);
    }

    notify_observers();
    return *created;
}

Result<void> ClipboardStore::unpin_item(const std::string& id, const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        auto state = current();
        auto pinned = std::make_shared<PinnedList>(*state->pinned);
        size_t before = pinned->size();
        pinned->erase(std::remove_if(pinned->begin(), pinned->end(),
            [&](const PinnedItem& p) { return p.item.id() == id || p.id == id; }), pinned->end());

        if (pinned->size() == before) {
            return Error(ErrorCode::PINNED_ITEM_NOT_FOUND, "No pin for '" + id + "'");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        auto next = std::make_shared<StoreState>(*state);
        next->pinned = std::move(pinned);
        refresh_active(*next);
        publish(std::move(next), FLUSH_PINNED);
    }

    notify_observers();
    return Ok();
}

Result<bool> ClipboardStore::toggle_pin(const ItemId& id, const CancellationToken& token) {
    auto state = current();
    bool pinned = std::any_of(state->pinned->begin(), state->pinned->end(),
        [&](const PinnedItem& p) { return p.item.id() == id; });

    if (pinned) {
        auto result = unpin_item(id, token);
        if (!result.ok()) return result.error();
        return false;
    }

    auto result = pin_item(id, std::nullopt, token);
    if (!result.ok()) return result.error();
    return true;
}

Result<void> ClipboardStore::rename_pin(const PinId& pin_id,
                                        std::optional<std::string> custom_title,
                                        const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        auto state = current();
        auto pinned = std::make_shared<PinnedList>(*state->pinned);
        auto it = std::find_if(pinned->begin(), pinned->end(),
            [&](const PinnedItem& p) { return p.id == pin_id; });
        if (it == pinned->end()) {
            return Error(ErrorCode::PINNED_ITEM_NOT_FOUND, "No pin with id '" + pin_id + "'");
        }
        if (custom_title && is_blank(*custom_title)) {
            custom_title.reset();
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        it->custom_title = std::move(custom_title);
        auto next = std::make_shared<StoreState>(*state);
        next->pinned = std::move(pinned);
        publish(std::move(next), FLUSH_PINNED);
    }

    notify_observers();
    return Ok();
}

// ============================================================================
// Settings
// ============================================================================

Result<void> ClipboardStore::save_settings(Settings settings, const CancellationToken& token) {
    bool rich_text_changed = false;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        auto valid = settings.validate();
        if (!valid.ok()) {
            return valid;
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        if (settings_repo_) {
            auto saved = settings_repo_->save(settings);
            if (!saved.ok()) {
                return wrap_error(ErrorCode::STATE_PERSISTENCE_FAILED,
                                  "Failed to persist settings", saved.error());
            }
        }

        auto state = current();
        const Settings& previous = *state->settings;
        rich_text_changed = previous.capture_rich_text != settings.capture_rich_text;
        bool encryption_changed = previous.encrypt_history != settings.encrypt_history;

        uint32_t targets = FLUSH_NONE;
        auto next = std::make_shared<StoreState>(*state);

        size_t limit = settings.effective_history_limit();
        if (state->history->size() > limit) {
            auto history = std::make_shared<HistoryList>(*state->history);
            truncate_history(*history, limit);
            next->history = std::move(history);
            targets |= FLUSH_HISTORY;
            logger_->info("History truncated to " + std::to_string(limit) + " items");
        }
        if (encryption_changed) {
            targets |= FLUSH_HISTORY;
            logger_->info(settings.encrypt_history ? "History encryption enabled"
                                                   : "History encryption disabled");
        }
        if (!previous.remember_history && settings.remember_history &&
            next->history->empty() && history_repo_) {
            // Pick up what was stored before recording was paused
            auto loaded = history_repo_->load(previous.encrypt_history);
            if (loaded.ok()) {
                auto history = std::make_shared<HistoryList>();
                for (auto& item : *loaded) {
                    if (!image_too_large(item, max_image_bytes_)) {
                        history->push_back(std::move(item));
                    }
                }
                truncate_history(*history, limit);
                next->history = std::move(history);
                logger_->info("Resumed history recording with " +
                              std::to_string(next->history->size()) + " stored items");
            } else {
                logger_->warning("Could not reload stored history: " +
                                 loaded.error().to_string());
            }
        }

        next->settings = std::make_shared<const Settings>(std::move(settings));
        refresh_active(*next);
        publish(std::move(next), targets);
    }

    notify_observers();

    if (rich_text_changed) {
        std::lock_guard<std::mutex> lock(runtime_mutex_);
        if (runtime_running_.load()) {
            bool capture = current()->settings->capture_rich_text;
            auto updated = monitor_->update_capture_rich_text(capture);
            if (!updated.ok()) {
                return wrap_error(ErrorCode::INVALID_OPERATION,
                                  "Failed to update rich text capture mode", updated.error());
            }
        }
    }
    return Ok();
}

// ============================================================================
// Snippets
// ============================================================================

Result<Snippet> ClipboardStore::add_snippet(std::string title,
                                            std::string content,
                                            std::string category,
                                            const CancellationToken& token) {
    Snippet created;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready.error();

        if (is_blank(title)) {
            return Error(ErrorCode::VALIDATION_ERROR, "Snippet title cannot be empty");
        }

        auto state = current();
        if (state->snippets->size() >= limits::MAX_SNIPPETS) {
            return Error(ErrorCode::DOMAIN_LIMIT_EXCEEDED,
                         "Cannot store more than " + std::to_string(limits::MAX_SNIPPETS) +
                         " snippets");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        created = Snippet::create(std::move(title), std::move(content), std::move(category));
        auto snippets = std::make_shared<SnippetList>(*state->snippets);
        snippets->push_back(created);

        auto next = std::make_shared<StoreState>(*state);
        next->snippets = std::move(snippets);
        publish(std::move(next), FLUSH_SNIPPETS);
    }

    notify_observers();
    return created;
}

Result<void> ClipboardStore::update_snippet(Snippet snippet, const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        if (is_blank(snippet.title)) {
            return Error(ErrorCode::VALIDATION_ERROR, "Snippet title cannot be empty");
        }

        auto state = current();
        auto snippets = std::make_shared<SnippetList>(*state->snippets);
        auto it = std::find_if(snippets->begin(), snippets->end(),
            [&](const Snippet& s) { return s.id == snippet.id; });
        if (it == snippets->end()) {
            return Error(ErrorCode::NOT_FOUND, "Snippet '" + snippet.id + "' was not found");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        snippet.created_at = it->created_at;
        *it = std::move(snippet);

        auto next = std::make_shared<StoreState>(*state);
        next->snippets = std::move(snippets);
        publish(std::move(next), FLUSH_SNIPPETS);
    }

    notify_observers();
    return Ok();
}

Result<void> ClipboardStore::delete_snippet(const SnippetId& id, const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        auto state = current();
        auto snippets = std::make_shared<SnippetList>(*state->snippets);
        size_t before = snippets->size();
        snippets->erase(std::remove_if(snippets->begin(), snippets->end(),
            [&](const Snippet& s) { return s.id == id; }), snippets->end());
        if (snippets->size() == before) {
            return Error(ErrorCode::NOT_FOUND, "Snippet '" + id + "' was not found");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        auto next = std::make_shared<StoreState>(*state);
        next->snippets = std::move(snippets);
        publish(std::move(next), FLUSH_SNIPPETS);
    }

    notify_observers();
    return Ok();
}

Result<std::string> ClipboardStore::use_snippet(const SnippetId& id,
                                                const std::map<std::string, std::string>& values,
                                                const CancellationToken& token) {
    std::string resolved;
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready.error();

        auto state = current();
        auto snippets = std::make_shared<SnippetList>(*state->snippets);
        auto it = std::find_if(snippets->begin(), snippets->end(),
            [&](const Snippet& s) { return s.id == id; });
        if (it == snippets->end()) {
            return Error(ErrorCode::NOT_FOUND, "Snippet '" + id + "' was not found");
        }
        if (token.is_cancelled()) {
            return canceled();
        }

        resolved = it->resolve(values);
        it->last_used_at = now_millis();

        auto next = std::make_shared<StoreState>(*state);
        next->snippets = std::move(snippets);
        publish(std::move(next), FLUSH_SNIPPETS);
    }

    notify_observers();
    return resolved;
}

// ============================================================================
// Backup support
// ============================================================================

BackupPayload ClipboardStore::snapshot() const {
    auto state = current();
    BackupPayload payload;
    payload.version = BACKUP_FORMAT_VERSION;
    payload.history = *state->history;
    payload.pinned = *state->pinned;
    return payload;
}

Result<void> ClipboardStore::restore(BackupPayload payload, const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutation_mutex_);
        auto ready = require_initialized();
        if (!ready.ok()) return ready;

        if (payload.version != BACKUP_FORMAT_VERSION) {
            return Error(ErrorCode::DATA_FORMAT_INVALID,
                         "Unsupported backup version " + std::to_string(payload.version));
        }

        auto state = current();
        const Settings& settings = *state->settings;

        auto history = std::make_shared<HistoryList>();
        for (auto& item : payload.history) {
            if (!image_too_large(item, max_image_bytes_)) {
                history->push_back(std::move(item));
            }
        }
        truncate_history(*history, settings.effective_history_limit());

        auto pinned = std::make_shared<PinnedList>(std::move(payload.pinned));
        if (pinned->size() > limits::MAX_PINNED_ITEMS) {
            pinned->erase(pinned->begin() + limits::MAX_PINNED_ITEMS, pinned->end());
        }

        if (token.is_cancelled()) {
            return canceled();
        }

        auto next = std::make_shared<StoreState>(*state);
        next->history = std::move(history);
        next->pinned = std::move(pinned);
        refresh_active(*next);

        uint64_t generation = generation_.load() + 1;
        auto written = flush_worker_->write_now(make_flush_snapshot(*next, generation),
                                                FLUSH_HISTORY | FLUSH_PINNED);
        if (!written.ok()) {
            // Put the previous state back on disk before reporting
            auto rollback = flush_worker_->write_now(
                make_flush_snapshot(*state, generation_.load()), FLUSH_HISTORY | FLUSH_PINNED);
            if (!rollback.ok()) {
                logger_->error("Rollback after failed restore also failed: " +
                               rollback.error().to_string());
            }
            return wrap_error(ErrorCode::STATE_PERSISTENCE_FAILED,
                              "Failed to persist restored state", written.error());
        }

        publish(std::move(next), FLUSH_NONE);
        logger_->info("Restored backup with " + std::to_string(current()->history->size()) +
                      " history items and " + std::to_string(current()->pinned->size()) +
                      " pinned items");
    }

    notify_observers();
    return Ok();
}

// ============================================================================
// Observers and persistence
// ============================================================================

SubscriptionId ClipboardStore::subscribe(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    SubscriptionId id = next_subscription_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void ClipboardStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(id);
}

Result<void> ClipboardStore::flush() {
    return flush_worker_->flush();
}

}  // namespace clipstash
