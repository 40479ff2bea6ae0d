#include <gtest/gtest.h>
#include <clipstash/clipboard_store.hpp>

#include "test_fakes.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

using namespace clipstash;
using namespace clipstash::test;
namespace fs = std::filesystem;

class ClipboardStoreTest : public ::testing::Test {
protected:
    ClipboardStore::Dependencies deps() {
        ClipboardStore::Dependencies d;
        d.history_repository = history_;
        d.pinned_repository = pinned_;
        d.snippet_repository = snippets_;
        d.settings_repository = settings_;
        d.monitor = monitor_;
        d.auto_paste = paste_;
        return d;
    }

    std::unique_ptr<ClipboardStore> open_store() {
        return open_store(deps());
    }

    std::unique_ptr<ClipboardStore> open_store(ClipboardStore::Dependencies d) {
        auto store = std::make_unique<ClipboardStore>(std::move(d));
        auto report = store->initialize();
        EXPECT_TRUE(report.ok()) << report.error().to_string();
        return store;
    }

    // Persist and apply a history cap
    void set_limit(ClipboardStore& store, int limit) {
        Settings settings = store.settings();
        settings.enable_history_limit = true;
        settings.max_history_items = limit;
        ASSERT_TRUE(store.save_settings(settings).ok());
    }

    static std::vector<std::string> texts(const std::vector<ClipboardItem>& items) {
        std::vector<std::string> out;
        for (const auto& item : items) out.push_back(*item.text());
        return out;
    }

    std::shared_ptr<MemoryHistoryRepository> history_ = std::make_shared<MemoryHistoryRepository>();
    std::shared_ptr<MemoryPinnedRepository> pinned_ = std::make_shared<MemoryPinnedRepository>();
    std::shared_ptr<MemorySnippetRepository> snippets_ = std::make_shared<MemorySnippetRepository>();
    std::shared_ptr<MemorySettingsRepository> settings_ = std::make_shared<MemorySettingsRepository>();
    std::shared_ptr<FakeClipboardMonitor> monitor_ = std::make_shared<FakeClipboardMonitor>();
    std::shared_ptr<FakeAutoPasteService> paste_ = std::make_shared<FakeAutoPasteService>();
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(ClipboardStoreTest, InitializeLoadsEveryAggregate) {
    history_->items = {text_item("h1", 2000), text_item("h2", 1000)};
    pinned_->items = {PinnedItem::create(ClipboardItem::make_text("p1"))};
    snippets_->items = {Snippet::create("s", "c")};

    ClipboardStore store(deps());
    auto report = store.initialize();
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->history_count, 2u);
    EXPECT_EQ(report->pinned_count, 1u);
    EXPECT_EQ(report->snippet_count, 1u);
    EXPECT_TRUE(report->warnings.empty());
    EXPECT_TRUE(store.is_initialized());
    EXPECT_EQ(texts(*store.history()), (std::vector<std::string>{"h1", "h2"}));
}

TEST_F(ClipboardStoreTest, MutationsBeforeInitializeAreRejected) {
    ClipboardStore store(deps());
    EXPECT_EQ(store.add_item(ClipboardItem::make_text("x")).error_code(),
              ErrorCode::INVALID_OPERATION);
    EXPECT_EQ(store.clear_history().error_code(), ErrorCode::INVALID_OPERATION);
    EXPECT_EQ(store.start_runtime().error_code(), ErrorCode::STATE_INITIALIZATION_FAILED);
}

TEST_F(ClipboardStoreTest, SecondInitializeIsNoOp) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("kept")).ok());
    uint64_t generation = store->generation();

    auto report = store->initialize();
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->history_count, 1u);
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, CorruptAggregateStartsEmptyWithWarning) {
    history_->load_error = Error(ErrorCode::DESERIALIZATION_FAILED, "bad json");
    pinned_->items = {PinnedItem::create(ClipboardItem::make_text("p"))};

    ClipboardStore store(deps());
    auto report = store.initialize();
    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report->warnings.size(), 1u);
    EXPECT_EQ(report->warnings[0].code(), ErrorCode::DESERIALIZATION_FAILED);
    EXPECT_TRUE(store.history()->empty());
    EXPECT_EQ(store.pinned()->size(), 1u);
}

TEST_F(ClipboardStoreTest, UndecryptableHistoryIsRecoverable) {
    history_->load_error = Error(ErrorCode::DECRYPTION_FAILED, "wrong key");
    ClipboardStore store(deps());
    auto report = store.initialize();
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->warnings.size(), 1u);
}

TEST_F(ClipboardStoreTest, StorageFailureAbortsInitialization) {
    snippets_->load_error = Error(ErrorCode::STORAGE_ACCESS_DENIED, "permission denied");
    ClipboardStore store(deps());
    auto report = store.initialize();
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error_code(), ErrorCode::STATE_INITIALIZATION_FAILED);
    EXPECT_FALSE(store.is_initialized());
}

TEST_F(ClipboardStoreTest, InvalidStoredSettingsFallBackToDefaults) {
    settings_->settings.max_history_items = 0;
    ClipboardStore store(deps());
    auto report = store.initialize();
    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report->warnings.size(), 1u);
    EXPECT_EQ(report->warnings[0].code(), ErrorCode::SETTINGS_RANGE_INVALID);
    EXPECT_EQ(store.settings(), Settings());
}

TEST_F(ClipboardStoreTest, HistoryIsNotLoadedWhenRememberIsOff) {
    settings_->settings.remember_history = false;
    history_->items = {text_item("old", 1)};
    auto store = open_store();
    EXPECT_TRUE(store->history()->empty());
}

TEST_F(ClipboardStoreTest, LoadedHistoryIsTruncatedToLimit) {
    settings_->settings.enable_history_limit = true;
    settings_->settings.max_history_items = 10;
    for (int i = 0; i < 15; ++i) {
        history_->items.push_back(text_item("item " + std::to_string(i), 100 - i));
    }
    auto store = open_store();
    ASSERT_EQ(store->history()->size(), 10u);
    EXPECT_EQ(*store->history()->back().text(), "item 9");
}

TEST_F(ClipboardStoreTest, InitializeNotifiesObservers) {
    ClipboardStore store(deps());
    int notified = 0;
    store.subscribe([&] { ++notified; });
    ASSERT_TRUE(store.initialize().ok());
    EXPECT_EQ(notified, 1);
}

// ============================================================================
// Capture
// ============================================================================

TEST_F(ClipboardStoreTest, CapturePrependsAndPersists) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("first", 1000)).ok());
    ASSERT_TRUE(store->add_item(text_item("second", 2000)).ok());

    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"second", "first"}));
    EXPECT_EQ(store->generation(), 3u);

    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(texts(history_->stored()), (std::vector<std::string>{"second", "first"}));
}

TEST_F(ClipboardStoreTest, SequentialDuplicateRefreshesHead) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("same", 1000)).ok());
    ItemId original = store->history()->front().id();

    ItemSource source;
    source.app_id = "org.example.Browser";
    auto again = ClipboardItem::make_text("same", ItemType::TEXT, source)
        .with_timestamp(from_epoch_millis(5000));
    ASSERT_TRUE(store->add_item(again).ok());

    ASSERT_EQ(store->history()->size(), 1u);
    const auto& head = store->history()->front();
    EXPECT_EQ(head.id(), original);
    EXPECT_EQ(to_epoch_millis(head.timestamp()), 5000);
    EXPECT_EQ(head.source().app_id, std::optional<std::string>("org.example.Browser"));
}

TEST_F(ClipboardStoreTest, DeduplicationOnlyConsidersHead) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());
    ASSERT_TRUE(store->add_item(text_item("a", 3)).ok());

    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"a", "b", "a"}));
}

TEST_F(ClipboardStoreTest, HistoryLimitDropsOldest) {
    auto store = open_store();
    set_limit(*store, 10);

    for (int i = 0; i < 15; ++i) {
        ASSERT_TRUE(store->add_item(text_item("item " + std::to_string(i), i)).ok());
        EXPECT_LE(store->history()->size(), 10u);
    }
    ASSERT_EQ(store->history()->size(), 10u);
    EXPECT_EQ(*store->history()->front().text(), "item 14");
    EXPECT_EQ(*store->history()->back().text(), "item 5");
}

TEST_F(ClipboardStoreTest, UnlimitedHistoryStopsAtHardLimit) {
    auto store = open_store();
    for (int i = 0; i < 505; ++i) {
        ASSERT_TRUE(store->add_item(text_item("item " + std::to_string(i), i)).ok());
    }
    EXPECT_EQ(store->history()->size(), limits::MAX_HISTORY_ITEMS_HARD_LIMIT);
}

TEST_F(ClipboardStoreTest, TruncationNeverTouchesPins) {
    auto store = open_store();
    set_limit(*store, 10);
    ASSERT_TRUE(store->add_item(text_item("pinned", 0)).ok());
    ASSERT_TRUE(store->pin_item(store->history()->front().id()).ok());

    for (int i = 1; i <= 20; ++i) {
        ASSERT_TRUE(store->add_item(text_item("item " + std::to_string(i), i)).ok());
    }
    ASSERT_EQ(store->pinned()->size(), 1u);
    EXPECT_EQ(*store->pinned()->front().item.text(), "pinned");
}

TEST_F(ClipboardStoreTest, IncognitoCaptureIsNoOp) {
    auto store = open_store();
    Settings settings = store->settings();
    settings.incognito_mode = true;
    ASSERT_TRUE(store->save_settings(settings).ok());
    ASSERT_TRUE(store->flush().ok());

    int notified = 0;
    store->subscribe([&] { ++notified; });
    uint64_t generation = store->generation();
    int saves = history_->save_count;

    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("secret")).ok());
    ASSERT_TRUE(store->flush().ok());

    EXPECT_TRUE(store->history()->empty());
    EXPECT_EQ(store->generation(), generation);
    EXPECT_EQ(notified, 0);
    EXPECT_EQ(history_->save_count, saves);
}

TEST_F(ClipboardStoreTest, RememberHistoryOffIgnoresCaptures) {
    auto store = open_store();
    Settings settings = store->settings();
    settings.remember_history = false;
    ASSERT_TRUE(store->save_settings(settings).ok());

    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("ignored")).ok());
    EXPECT_TRUE(store->history()->empty());
}

TEST_F(ClipboardStoreTest, ExcludedSourceIsIgnored) {
    auto store = open_store();
    Settings settings = store->settings();
    settings.excluded_app_ids = {"org.example.Passwords"};
    ASSERT_TRUE(store->save_settings(settings).ok());

    ItemSource source;
    source.app_id = "ORG.EXAMPLE.PASSWORDS";
    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("hunter2", ItemType::TEXT, source)).ok());
    EXPECT_TRUE(store->history()->empty());

    source.app_id = "org.example.Notes";
    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("note", ItemType::TEXT, source)).ok());
    EXPECT_EQ(store->history()->size(), 1u);
}

TEST_F(ClipboardStoreTest, OversizeImageIsRejected) {
    auto d = deps();
    d.max_persisted_image_bytes = 16;
    auto store = open_store(std::move(d));

    auto result = store->add_item(ClipboardItem::make_image(std::string(17, 'x')));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::CLIPBOARD_IMAGE_TOO_LARGE);
    EXPECT_TRUE(store->history()->empty());

    EXPECT_TRUE(store->add_item(ClipboardItem::make_image(std::string(16, 'x'))).ok());
    EXPECT_EQ(store->history()->size(), 1u);
}

TEST_F(ClipboardStoreTest, FlushFailureDoesNotFailCapture) {
    auto store = open_store();
    history_->set_fail_saves(true);

    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("in memory")).ok());
    EXPECT_EQ(store->history()->size(), 1u);
    EXPECT_EQ(store->flush().error_code(), ErrorCode::STORAGE_WRITE_FAILED);

    history_->set_fail_saves(false);
    ASSERT_TRUE(store->add_item(ClipboardItem::make_text("next")).ok());
    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(history_->stored().size(), 2u);
}

// ============================================================================
// Delete / clear
// ============================================================================

TEST_F(ClipboardStoreTest, DeleteRemovesItemAndItsPin) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());
    ItemId id = store->history()->back().id();
    ASSERT_TRUE(store->pin_item(id).ok());

    ASSERT_TRUE(store->delete_item(id).ok());
    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"b"}));
    EXPECT_TRUE(store->pinned()->empty());
}

TEST_F(ClipboardStoreTest, DeleteUnknownIdFails) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    uint64_t generation = store->generation();

    auto result = store->delete_item("no-such-id");
    EXPECT_EQ(result.error_code(), ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND);
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, ClearKeepsPins) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->pin_item(store->history()->front().id()).ok());
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());

    ASSERT_TRUE(store->clear_history().ok());
    EXPECT_TRUE(store->history()->empty());
    EXPECT_EQ(store->pinned()->size(), 1u);

    // Idempotent
    EXPECT_TRUE(store->clear_history().ok());
}

TEST_F(ClipboardStoreTest, ClearRemovesStoredHistoryThatWasNotLoaded) {
    history_->items = {text_item("stored", 1)};
    settings_->settings.remember_history = false;
    auto store = open_store();
    ASSERT_TRUE(store->history()->empty());
    uint64_t generation = store->generation();

    ASSERT_TRUE(store->clear_history().ok());
    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(history_->clear_count, 1);
    EXPECT_TRUE(history_->stored().empty());
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, FailedClearKeepsHistory) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->flush().ok());
    history_->set_fail_saves(true);

    auto result = store->clear_history();
    EXPECT_EQ(result.error_code(), ErrorCode::STATE_PERSISTENCE_FAILED);
    EXPECT_EQ(store->history()->size(), 1u);
}

TEST_F(ClipboardStoreTest, HistoryIsNotWrittenWhileRecordingIsOff) {
    history_->items = {text_item("kept", 1)};
    settings_->settings.remember_history = false;
    auto store = open_store();

    Settings settings = store->settings();
    settings.encrypt_history = true;
    ASSERT_TRUE(store->save_settings(settings).ok());
    ASSERT_TRUE(store->flush().ok());

    EXPECT_EQ(history_->saves(), 0);
    EXPECT_EQ(texts(history_->stored()), (std::vector<std::string>{"kept"}));
}

TEST_F(ClipboardStoreTest, ResumingRecordingReloadsStoredHistory) {
    history_->items = {text_item("older", 1)};
    settings_->settings.remember_history = false;
    auto store = open_store();
    ASSERT_TRUE(store->history()->empty());

    Settings settings = store->settings();
    settings.remember_history = true;
    ASSERT_TRUE(store->save_settings(settings).ok());
    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"older"}));

    ASSERT_TRUE(store->add_item(text_item("newer", 2)).ok());
    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(texts(history_->stored()), (std::vector<std::string>{"newer", "older"}));
}

TEST_F(ClipboardStoreTest, DeletingActiveItemClearsActive) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ItemId id = store->history()->front().id();
    ASSERT_TRUE(store->select_item(id).ok());
    ASSERT_TRUE(store->active_item().has_value());

    ASSERT_TRUE(store->delete_item(id).ok());
    EXPECT_FALSE(store->active_item().has_value());
}

// ============================================================================
// Select / copy / paste
// ============================================================================

TEST_F(ClipboardStoreTest, SelectWritesClipboardAndMarksActive) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("pick me", 1)).ok());
    ItemId id = store->history()->front().id();

    ASSERT_TRUE(store->select_item(id).ok());
    ASSERT_EQ(paste_->written.size(), 1u);
    EXPECT_EQ(*paste_->written[0].text(), "pick me");
    EXPECT_EQ(paste_->paste_count, 0);
    ASSERT_TRUE(store->active_item().has_value());
    EXPECT_EQ(store->active_item()->id(), id);
}

TEST_F(ClipboardStoreTest, SelectPastesWhenAutoPasteEnabled) {
    auto store = open_store();
    Settings settings = store->settings();
    settings.auto_paste_enabled = true;
    ASSERT_TRUE(store->save_settings(settings).ok());
    ASSERT_TRUE(store->add_item(text_item("x", 1)).ok());

    ASSERT_TRUE(store->select_item(store->history()->front().id()).ok());
    EXPECT_EQ(paste_->paste_count, 1);
}

TEST_F(ClipboardStoreTest, CopyAndPaste) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("x", 1)).ok());
    ItemId id = store->history()->front().id();

    ASSERT_TRUE(store->copy_item(id).ok());
    EXPECT_EQ(paste_->written.size(), 1u);
    EXPECT_EQ(paste_->paste_count, 0);
    EXPECT_FALSE(store->active_item().has_value());

    ASSERT_TRUE(store->paste_item(id).ok());
    EXPECT_EQ(paste_->written.size(), 2u);
    EXPECT_EQ(paste_->paste_count, 1);
}

TEST_F(ClipboardStoreTest, SelectFallsBackToPinnedOriginal) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("pinned only", 1)).ok());
    ItemId id = store->history()->front().id();
    ASSERT_TRUE(store->pin_item(id).ok());
    ASSERT_TRUE(store->clear_history().ok());

    ASSERT_TRUE(store->select_item(id).ok());
    EXPECT_EQ(*paste_->written.back().text(), "pinned only");
}

TEST_F(ClipboardStoreTest, SelectUnknownIdFails) {
    auto store = open_store();
    EXPECT_EQ(store->select_item("missing").error_code(),
              ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND);
    EXPECT_TRUE(paste_->written.empty());
}

// ============================================================================
// Pins
// ============================================================================

TEST_F(ClipboardStoreTest, PinSnapshotsItemAtFront) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());

    auto first = store->pin_item(store->history()->back().id(), std::string("Alpha"));
    ASSERT_TRUE(first.ok());
    auto second = store->pin_item(store->history()->front().id());
    ASSERT_TRUE(second.ok());

    ASSERT_EQ(store->pinned()->size(), 2u);
    EXPECT_EQ(store->pinned()->front().id, second->id);
    EXPECT_EQ(store->pinned()->back().display_title(), "Alpha");

    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(pinned_->stored().size(), 2u);
}

TEST_F(ClipboardStoreTest, PinnedSnapshotIgnoresLaterHistoryChanges) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("same", 1000)).ok());
    ASSERT_TRUE(store->pin_item(store->history()->front().id()).ok());

    ASSERT_TRUE(store->add_item(text_item("same", 9000)).ok());
    EXPECT_EQ(to_epoch_millis(store->history()->front().timestamp()), 9000);
    EXPECT_EQ(to_epoch_millis(store->pinned()->front().item.timestamp()), 1000);
}

TEST_F(ClipboardStoreTest, DuplicatePinIsRejected) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ItemId id = store->history()->front().id();
    ASSERT_TRUE(store->pin_item(id).ok());

    EXPECT_EQ(store->pin_item(id).error_code(), ErrorCode::PINNED_ITEM_DUPLICATE);

    // Equivalent content under another id is a duplicate as well
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());
    ASSERT_TRUE(store->add_item(text_item("a", 3)).ok());
    EXPECT_EQ(store->pin_item(store->history()->front().id()).error_code(),
              ErrorCode::PINNED_ITEM_DUPLICATE);
}

TEST_F(ClipboardStoreTest, PinLimitIsAHardStop) {
    auto store = open_store();
    for (int i = 0; i <= 50; ++i) {
        ASSERT_TRUE(store->add_item(text_item("item " + std::to_string(i), i)).ok());
    }
    auto history = store->history();
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(store->pin_item((*history)[i].id()).ok()) << i;
    }

    uint64_t generation = store->generation();
    auto result = store->pin_item((*history)[50].id());
    EXPECT_EQ(result.error_code(), ErrorCode::PINNED_ITEMS_LIMIT_EXCEEDED);
    EXPECT_EQ(store->pinned()->size(), limits::MAX_PINNED_ITEMS);
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, PinUnknownItemFails) {
    auto store = open_store();
    EXPECT_EQ(store->pin_item("missing").error_code(), ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND);
}

TEST_F(ClipboardStoreTest, UnpinUnknownIdLeavesStateUntouched) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->pin_item(store->history()->front().id()).ok());
    uint64_t generation = store->generation();

    EXPECT_EQ(store->unpin_item("missing").error_code(), ErrorCode::PINNED_ITEM_NOT_FOUND);
    EXPECT_EQ(store->pinned()->size(), 1u);
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, UnpinByItemIdOrPinId) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());
    auto history = store->history();

    ASSERT_TRUE(store->pin_item((*history)[0].id()).ok());
    auto pin = store->pin_item((*history)[1].id());
    ASSERT_TRUE(pin.ok());

    ASSERT_TRUE(store->unpin_item((*history)[0].id()).ok());
    ASSERT_TRUE(store->unpin_item(pin->id).ok());
    EXPECT_TRUE(store->pinned()->empty());
}

TEST_F(ClipboardStoreTest, TogglePin) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ItemId id = store->history()->front().id();

    auto pinned = store->toggle_pin(id);
    ASSERT_TRUE(pinned.ok());
    EXPECT_TRUE(*pinned);
    EXPECT_EQ(store->pinned()->size(), 1u);

    auto unpinned = store->toggle_pin(id);
    ASSERT_TRUE(unpinned.ok());
    EXPECT_FALSE(*unpinned);
    EXPECT_TRUE(store->pinned()->empty());
}

TEST_F(ClipboardStoreTest, RenamePin) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("content", 1)).ok());
    auto pin = store->pin_item(store->history()->front().id());
    ASSERT_TRUE(pin.ok());

    ASSERT_TRUE(store->rename_pin(pin->id, std::string("Named")).ok());
    EXPECT_EQ(store->pinned()->front().display_title(), "Named");

    ASSERT_TRUE(store->rename_pin(pin->id, std::string("   ")).ok());
    EXPECT_FALSE(store->pinned()->front().custom_title.has_value());
    EXPECT_EQ(store->pinned()->front().display_title(), "content");

    EXPECT_EQ(store->rename_pin("missing", std::string("x")).error_code(),
              ErrorCode::PINNED_ITEM_NOT_FOUND);
}

// ============================================================================
// Settings
// ============================================================================

TEST_F(ClipboardStoreTest, InvalidSettingsAreRejected) {
    auto store = open_store();
    Settings settings = store->settings();
    settings.font_size_scale = 10.0;

    EXPECT_EQ(store->save_settings(settings).error_code(), ErrorCode::SETTINGS_RANGE_INVALID);
    EXPECT_EQ(store->settings(), Settings());
    EXPECT_EQ(settings_->save_count, 0);
}

TEST_F(ClipboardStoreTest, SettingsArePersistedSynchronously) {
    auto store = open_store();
    Settings settings = store->settings();
    settings.theme_override = "light";

    ASSERT_TRUE(store->save_settings(settings).ok());
    EXPECT_EQ(settings_->settings.theme_override, "light");
    EXPECT_EQ(store->settings().theme_override, "light");
}

TEST_F(ClipboardStoreTest, SettingsPersistenceFailureCommitsNothing) {
    auto store = open_store();
    settings_->fail_saves = true;
    Settings settings = store->settings();
    settings.incognito_mode = true;

    auto result = store->save_settings(settings);
    EXPECT_EQ(result.error_code(), ErrorCode::STATE_PERSISTENCE_FAILED);
    EXPECT_FALSE(store->settings().incognito_mode);
}

TEST_F(ClipboardStoreTest, ReducingLimitTruncatesImmediately) {
    auto store = open_store();
    for (int i = 0; i < 30; ++i) {
        ASSERT_TRUE(store->add_item(text_item("item " + std::to_string(i), i)).ok());
    }

    set_limit(*store, 12);
    ASSERT_EQ(store->history()->size(), 12u);
    EXPECT_EQ(*store->history()->front().text(), "item 29");
    EXPECT_EQ(*store->history()->back().text(), "item 18");

    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(history_->stored().size(), 12u);
}

TEST_F(ClipboardStoreTest, TogglingEncryptionRewritesHistory) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->flush().ok());
    EXPECT_FALSE(history_->last_encrypted);

    Settings settings = store->settings();
    settings.encrypt_history = true;
    ASSERT_TRUE(store->save_settings(settings).ok());
    ASSERT_TRUE(store->flush().ok());
    EXPECT_TRUE(history_->last_encrypted);
    EXPECT_EQ(history_->stored().size(), 1u);
}

TEST_F(ClipboardStoreTest, RichTextChangeReachesRunningMonitor) {
    auto store = open_store();
    ASSERT_TRUE(store->start_runtime().ok());
    EXPECT_TRUE(monitor_->rich_text);

    Settings settings = store->settings();
    settings.capture_rich_text = false;
    ASSERT_TRUE(store->save_settings(settings).ok());
    EXPECT_FALSE(monitor_->rich_text);
}

// ============================================================================
// Runtime
// ============================================================================

TEST_F(ClipboardStoreTest, RuntimeRoutesCapturesIntoHistory) {
    auto store = open_store();
    ASSERT_TRUE(store->start_runtime().ok());
    EXPECT_TRUE(store->is_runtime_running());

    ASSERT_TRUE(monitor_->emit(ClipboardItem::make_text("captured")).ok());
    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"captured"}));

    ASSERT_TRUE(store->stop_runtime().ok());
    EXPECT_FALSE(store->is_runtime_running());
    EXPECT_EQ(monitor_->stop_count, 1);
    EXPECT_FALSE(monitor_->emit(ClipboardItem::make_text("late")).ok());
}

TEST_F(ClipboardStoreTest, SecondStartIsNoOp) {
    auto store = open_store();
    ASSERT_TRUE(store->start_runtime().ok());
    ASSERT_TRUE(store->start_runtime().ok());
    EXPECT_EQ(monitor_->start_count, 1);

    ASSERT_TRUE(store->stop_runtime().ok());
    ASSERT_TRUE(store->stop_runtime().ok());
    EXPECT_EQ(monitor_->stop_count, 1);
}

TEST_F(ClipboardStoreTest, MonitorStartFailure) {
    monitor_->fail_start = true;
    auto store = open_store();
    EXPECT_EQ(store->start_runtime().error_code(), ErrorCode::CLIPBOARD_MONITOR_START_FAILED);
    EXPECT_FALSE(store->is_runtime_running());
}

TEST_F(ClipboardStoreTest, RuntimeWithoutMonitorFails) {
    auto d = deps();
    d.monitor = nullptr;
    auto store = open_store(std::move(d));
    EXPECT_EQ(store->start_runtime().error_code(), ErrorCode::CLIPBOARD_MONITOR_START_FAILED);
}

TEST_F(ClipboardStoreTest, DestructorStopsRuntime) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->start_runtime().ok());
    }
    EXPECT_EQ(monitor_->stop_count, 1);
}

// ============================================================================
// Snippets
// ============================================================================

TEST_F(ClipboardStoreTest, SnippetLifecycle) {
    auto store = open_store();

    auto added = store->add_snippet("Greeting", "Hello {name}", "mail");
    ASSERT_TRUE(added.ok());
    EXPECT_EQ(store->snippets()->size(), 1u);

    Snippet changed = *added;
    changed.content = "Hi {name}!";
    changed.created_at = from_epoch_millis(1);
    ASSERT_TRUE(store->update_snippet(changed).ok());
    EXPECT_EQ(store->snippets()->front().content, "Hi {name}!");
    EXPECT_EQ(store->snippets()->front().created_at, added->created_at);

    auto used = store->use_snippet(added->id, {{"name", "Ada"}});
    ASSERT_TRUE(used.ok());
    EXPECT_EQ(*used, "Hi Ada!");
    EXPECT_TRUE(store->snippets()->front().last_used_at.has_value());

    ASSERT_TRUE(store->flush().ok());
    ASSERT_EQ(snippets_->stored().size(), 1u);
    EXPECT_TRUE(snippets_->stored().front().last_used_at.has_value());

    ASSERT_TRUE(store->delete_snippet(added->id).ok());
    EXPECT_TRUE(store->snippets()->empty());
}

TEST_F(ClipboardStoreTest, SnippetValidation) {
    auto store = open_store();
    EXPECT_EQ(store->add_snippet("  ", "content").error_code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(store->delete_snippet("missing").error_code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(store->use_snippet("missing").error_code(), ErrorCode::NOT_FOUND);

    Snippet ghost = Snippet::create("ghost", "boo");
    EXPECT_EQ(store->update_snippet(ghost).error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(ClipboardStoreTest, SnippetLimit) {
    for (int i = 0; i < 200; ++i) {
        snippets_->items.push_back(Snippet::create("s" + std::to_string(i), "c"));
    }
    auto store = open_store();
    EXPECT_EQ(store->add_snippet("one more", "c").error_code(), ErrorCode::DOMAIN_LIMIT_EXCEEDED);
}

// ============================================================================
// Cancellation and observers
// ============================================================================

TEST_F(ClipboardStoreTest, CancelledMutationLeavesStateUntouched) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    uint64_t generation = store->generation();

    auto token = CancellationToken::create();
    token.cancel();

    EXPECT_EQ(store->add_item(text_item("b", 2), token).error_code(), ErrorCode::CANCELED);
    EXPECT_EQ(store->clear_history(token).error_code(), ErrorCode::CANCELED);
    EXPECT_EQ(store->pin_item(store->history()->front().id(), std::nullopt, token).error_code(),
              ErrorCode::CANCELED);
    EXPECT_EQ(store->history()->size(), 1u);
    EXPECT_TRUE(store->pinned()->empty());
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, ObserversAreNotifiedPerCommit) {
    auto store = open_store();
    int notified = 0;
    auto id = store->subscribe([&] { ++notified; });

    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    ASSERT_TRUE(store->add_item(text_item("b", 2)).ok());
    EXPECT_EQ(notified, 2);

    // Failed mutations do not notify
    EXPECT_FALSE(store->delete_item("missing").ok());
    EXPECT_EQ(notified, 2);

    store->unsubscribe(id);
    ASSERT_TRUE(store->clear_history().ok());
    EXPECT_EQ(notified, 2);
}

TEST_F(ClipboardStoreTest, ObserverMayReadState) {
    auto store = open_store();
    size_t seen = 0;
    store->subscribe([&] { seen = store->history()->size(); });

    ASSERT_TRUE(store->add_item(text_item("a", 1)).ok());
    EXPECT_EQ(seen, 1u);
}

// ============================================================================
// Restore
// ============================================================================

TEST_F(ClipboardStoreTest, RestoreReplacesAndPersistsSynchronously) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("old", 1)).ok());

    BackupPayload payload;
    payload.history = {text_item("r1", 20), text_item("r2", 10)};
    payload.pinned = {PinnedItem::create(text_item("rp", 5))};

    ASSERT_TRUE(store->restore(payload).ok());
    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"r1", "r2"}));
    EXPECT_EQ(store->pinned()->size(), 1u);

    EXPECT_EQ(texts(history_->stored()), (std::vector<std::string>{"r1", "r2"}));
    EXPECT_EQ(pinned_->stored().size(), 1u);
}

TEST_F(ClipboardStoreTest, RestoreRejectsUnknownVersion) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("keep", 1)).ok());
    uint64_t generation = store->generation();

    BackupPayload payload;
    payload.version = 2;
    payload.history = {text_item("new", 2)};

    EXPECT_EQ(store->restore(payload).error_code(), ErrorCode::DATA_FORMAT_INVALID);
    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"keep"}));
    EXPECT_EQ(store->generation(), generation);
}

TEST_F(ClipboardStoreTest, RestoreWriteFailureLeavesStateUntouched) {
    auto store = open_store();
    ASSERT_TRUE(store->add_item(text_item("keep", 1)).ok());
    ASSERT_TRUE(store->flush().ok());

    pinned_->set_fail_saves(true);
    BackupPayload payload;
    payload.history = {text_item("new", 2)};

    auto result = store->restore(payload);
    EXPECT_EQ(result.error_code(), ErrorCode::STATE_PERSISTENCE_FAILED);
    EXPECT_EQ(texts(*store->history()), (std::vector<std::string>{"keep"}));

    // History on disk was rolled back
    EXPECT_EQ(texts(history_->stored()), (std::vector<std::string>{"keep"}));
}

TEST_F(ClipboardStoreTest, RestoreAppliesLimits) {
    auto store = open_store();
    set_limit(*store, 10);

    BackupPayload payload;
    for (int i = 0; i < 20; ++i) {
        payload.history.push_back(text_item("h" + std::to_string(i), 100 - i));
    }
    for (int i = 0; i < 60; ++i) {
        payload.pinned.push_back(PinnedItem::create(text_item("p" + std::to_string(i), i)));
    }

    ASSERT_TRUE(store->restore(payload).ok());
    EXPECT_EQ(store->history()->size(), 10u);
    EXPECT_EQ(store->pinned()->size(), limits::MAX_PINNED_ITEMS);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ClipboardStoreTest, ConcurrentCaptureAndDeleteStayConsistent) {
    auto store = open_store();
    set_limit(*store, 50);

    constexpr int WRITERS = 4;
    constexpr int PER_WRITER = 200;
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::vector<std::thread> threads;
    for (int w = 0; w < WRITERS; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < PER_WRITER; ++i) {
                auto r = store->add_item(ClipboardItem::make_text(
                    "w" + std::to_string(w) + "-" + std::to_string(i)));
                if (!r.ok()) ++violations;
            }
        });
    }
    threads.emplace_back([&] {
        while (!done.load()) {
            auto history = store->history();
            if (!history->empty()) {
                auto r = store->delete_item(history->back().id());
                if (!r.ok() && r.error_code() != ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND) {
                    ++violations;
                }
            }
        }
    });
    threads.emplace_back([&] {
        while (!done.load()) {
            auto history = store->history();
            if (history->size() > 50) ++violations;
            std::set<ItemId> ids;
            for (const auto& item : *history) {
                if (!ids.insert(item.id()).second) ++violations;
            }
        }
    });

    for (int w = 0; w < WRITERS; ++w) {
        threads[w].join();
    }
    done.store(true);
    for (size_t i = WRITERS; i < threads.size(); ++i) {
        threads[i].join();
    }

    EXPECT_EQ(violations.load(), 0);
    EXPECT_LE(store->history()->size(), 50u);

    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(history_->stored().size(), store->history()->size());
}

// ============================================================================
// On-disk store
// ============================================================================

class ClipboardStoreDiskTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "clipstash_store_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::unique_ptr<ClipboardStore> open_store() {
        Config config;
        config.root_directory = test_dir_;
        auto result = ClipboardStore::open(config);
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result).value();
    }

    fs::path test_dir_;
};

TEST_F(ClipboardStoreDiskTest, StateSurvivesReopen) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->add_item(ClipboardItem::make_text("persisted")).ok());
        ASSERT_TRUE(store->pin_item(store->history()->front().id(), std::string("P")).ok());
        ASSERT_TRUE(store->add_snippet("sig", "-- {name}").ok());
    }

    auto store = open_store();
    ASSERT_EQ(store->history()->size(), 1u);
    EXPECT_EQ(*store->history()->front().text(), "persisted");
    ASSERT_EQ(store->pinned()->size(), 1u);
    EXPECT_EQ(store->pinned()->front().display_title(), "P");
    EXPECT_EQ(store->snippets()->size(), 1u);
}

TEST_F(ClipboardStoreDiskTest, EncryptedHistorySurvivesReopen) {
    {
        auto store = open_store();
        Settings settings = store->settings();
        settings.encrypt_history = true;
        ASSERT_TRUE(store->save_settings(settings).ok());
        ASSERT_TRUE(store->add_item(ClipboardItem::make_text("classified")).ok());
        ASSERT_TRUE(store->flush().ok());
    }

    EXPECT_TRUE(fs::exists(test_dir_ / "history.json.enc"));
    EXPECT_FALSE(fs::exists(test_dir_ / "history.json"));
    EXPECT_TRUE(fs::exists(test_dir_ / "history.key"));

    auto store = open_store();
    ASSERT_EQ(store->history()->size(), 1u);
    EXPECT_EQ(*store->history()->front().text(), "classified");
}

TEST_F(ClipboardStoreDiskTest, CorruptHistoryFileStartsEmpty) {
    {
        std::ofstream out(test_dir_ / "history.json");
        out << "{{{{";
    }
    auto store = open_store();
    EXPECT_TRUE(store->history()->empty());
    EXPECT_TRUE(store->add_item(ClipboardItem::make_text("fresh")).ok());
}

TEST_F(ClipboardStoreDiskTest, FileLoggerWritesLines) {
    Config config;
    config.root_directory = test_dir_;
    config.log_file = test_dir_ / "clipstash.log";
    {
        auto result = ClipboardStore::open(config);
        ASSERT_TRUE(result.ok()) << result.error().to_string();
    }

    std::ifstream in(config.log_file);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("[INFO]"), std::string::npos);
}

TEST_F(ClipboardStoreDiskTest, ClearRemovesHistoryFileAfterRecordingWasTurnedOff) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->add_item(ClipboardItem::make_text("secret")).ok());
        ASSERT_TRUE(store->flush().ok());
    }
    {
        auto store = open_store();
        Settings settings = store->settings();
        settings.remember_history = false;
        ASSERT_TRUE(store->save_settings(settings).ok());
    }
    ASSERT_TRUE(fs::exists(test_dir_ / "history.json"));

    {
        auto store = open_store();
        ASSERT_TRUE(store->history()->empty());
        ASSERT_TRUE(store->clear_history().ok());
        ASSERT_TRUE(store->flush().ok());
    }

    if (fs::exists(test_dir_ / "history.json")) {
        std::ifstream in(test_dir_ / "history.json");
        std::string disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        EXPECT_EQ(disk.find("secret"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(test_dir_ / "history.json.enc"));
}

TEST_F(ClipboardStoreDiskTest, StoredHistorySurvivesEncryptionToggleWhileRecordingIsOff) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->add_item(ClipboardItem::make_text("keepme")).ok());
        Settings settings = store->settings();
        settings.remember_history = false;
        ASSERT_TRUE(store->save_settings(settings).ok());
        ASSERT_TRUE(store->flush().ok());
    }
    {
        auto store = open_store();
        Settings settings = store->settings();
        settings.encrypt_history = !settings.encrypt_history;
        ASSERT_TRUE(store->save_settings(settings).ok());
        ASSERT_TRUE(store->flush().ok());
    }
    {
        auto store = open_store();
        Settings settings = store->settings();
        settings.remember_history = true;
        ASSERT_TRUE(store->save_settings(settings).ok());
    }

    auto store = open_store();
    ASSERT_EQ(store->history()->size(), 1u);
    EXPECT_EQ(*store->history()->front().text(), "keepme");
}
