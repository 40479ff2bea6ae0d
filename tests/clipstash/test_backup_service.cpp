#include <gtest/gtest.h>
#include <clipstash/backup_service.hpp>

#include "test_fakes.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using namespace clipstash;
using namespace clipstash::test;
namespace fs = std::filesystem;

class BackupServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "clipstash_backup_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        source_ = open_store(source_history_, source_pinned_);
        target_ = open_store(target_history_, target_pinned_);
    }

    void TearDown() override {
        source_.reset();
        target_.reset();
        fs::remove_all(test_dir_);
    }

    std::unique_ptr<ClipboardStore> open_store(
            const std::shared_ptr<MemoryHistoryRepository>& history,
            const std::shared_ptr<MemoryPinnedRepository>& pinned) {
        ClipboardStore::Dependencies deps;
        deps.history_repository = history;
        deps.pinned_repository = pinned;
        deps.snippet_repository = std::make_shared<MemorySnippetRepository>();
        deps.settings_repository = std::make_shared<MemorySettingsRepository>();
        auto store = std::make_unique<ClipboardStore>(std::move(deps));
        EXPECT_TRUE(store->initialize().ok());
        return store;
    }

    fs::path test_dir_;
    std::shared_ptr<MemoryHistoryRepository> source_history_ = std::make_shared<MemoryHistoryRepository>();
    std::shared_ptr<MemoryPinnedRepository> source_pinned_ = std::make_shared<MemoryPinnedRepository>();
    std::shared_ptr<MemoryHistoryRepository> target_history_ = std::make_shared<MemoryHistoryRepository>();
    std::shared_ptr<MemoryPinnedRepository> target_pinned_ = std::make_shared<MemoryPinnedRepository>();
    std::unique_ptr<ClipboardStore> source_;
    std::unique_ptr<ClipboardStore> target_;
};

TEST_F(BackupServiceTest, ExportImportRoundTrip) {
    ASSERT_TRUE(source_->add_item(text_item("https://example.com", 1000)).ok());
    ASSERT_TRUE(source_->add_item(ClipboardItem::make_image("\x89PNG\r\n\x1a\nrest")).ok());
    ASSERT_TRUE(source_->add_item(ClipboardItem::make_rich_text("bold", std::string("{\\rtf1 bold}"))).ok());
    ASSERT_TRUE(source_->pin_item(source_->history()->back().id(), std::string("Site")).ok());

    BackupService exporter(*source_);
    auto data = exporter.export_backup();
    ASSERT_TRUE(data.ok());

    BackupService importer(*target_);
    ASSERT_TRUE(importer.import_backup(*data).ok());

    EXPECT_EQ(*target_->history(), *source_->history());
    EXPECT_EQ(*target_->pinned(), *source_->pinned());
    EXPECT_EQ(target_history_->stored(), *source_->history());
}

TEST_F(BackupServiceTest, ExportIsVersionedJson) {
    ASSERT_TRUE(source_->add_item(text_item("a", 1)).ok());

    BackupService service(*source_);
    auto data = service.export_backup();
    ASSERT_TRUE(data.ok());

    auto doc = nlohmann::json::parse(*data);
    EXPECT_EQ(doc.at("version").get<int>(), 1);
    EXPECT_EQ(doc.at("history").size(), 1u);
    EXPECT_TRUE(doc.at("pinned").empty());
}

TEST_F(BackupServiceTest, UnknownVersionFailsAtomically) {
    ASSERT_TRUE(target_->add_item(text_item("keep", 1)).ok());
    uint64_t generation = target_->generation();

    nlohmann::json doc;
    doc["version"] = 2;
    doc["history"] = nlohmann::json::array();
    doc["pinned"] = nlohmann::json::array();

    BackupService service(*target_);
    auto result = service.import_backup(doc.dump());
    EXPECT_EQ(result.error_code(), ErrorCode::DATA_FORMAT_INVALID);
    ASSERT_EQ(target_->history()->size(), 1u);
    EXPECT_EQ(*target_->history()->front().text(), "keep");
    EXPECT_EQ(target_->generation(), generation);
}

TEST_F(BackupServiceTest, MalformedJsonIsRejected) {
    ASSERT_TRUE(target_->add_item(text_item("keep", 1)).ok());

    BackupService service(*target_);
    EXPECT_EQ(service.import_backup("not json").error_code(), ErrorCode::DATA_FORMAT_INVALID);
    EXPECT_EQ(service.import_backup("{\"history\": []}").error_code(),
              ErrorCode::DATA_FORMAT_INVALID);
    EXPECT_EQ(target_->history()->size(), 1u);
}

TEST_F(BackupServiceTest, ImportReplacesExistingState) {
    ASSERT_TRUE(target_->add_item(text_item("old", 1)).ok());
    ASSERT_TRUE(target_->pin_item(target_->history()->front().id()).ok());
    ASSERT_TRUE(source_->add_item(text_item("new", 2)).ok());

    auto data = BackupService(*source_).export_backup();
    ASSERT_TRUE(data.ok());
    ASSERT_TRUE(BackupService(*target_).import_backup(*data).ok());

    ASSERT_EQ(target_->history()->size(), 1u);
    EXPECT_EQ(*target_->history()->front().text(), "new");
    EXPECT_TRUE(target_->pinned()->empty());
}

TEST_F(BackupServiceTest, ImportWriteFailureLeavesStateUntouched) {
    ASSERT_TRUE(target_->add_item(text_item("keep", 1)).ok());
    ASSERT_TRUE(source_->add_item(text_item("new", 2)).ok());
    auto data = BackupService(*source_).export_backup();
    ASSERT_TRUE(data.ok());

    target_history_->set_fail_saves(true);
    auto result = BackupService(*target_).import_backup(*data);
    EXPECT_EQ(result.error_code(), ErrorCode::STATE_PERSISTENCE_FAILED);
    EXPECT_EQ(*target_->history()->front().text(), "keep");
}

TEST_F(BackupServiceTest, CancelledExport) {
    auto token = CancellationToken::create();
    token.cancel();
    EXPECT_EQ(BackupService(*source_).export_backup(token).error_code(), ErrorCode::CANCELED);
}

TEST_F(BackupServiceTest, FileRoundTrip) {
    ASSERT_TRUE(source_->add_item(text_item("on disk", 1)).ok());
    fs::path file = test_dir_ / "exports" / "backup.json";

    ASSERT_TRUE(BackupService(*source_).export_to_file(file).ok());
    EXPECT_TRUE(fs::exists(file));

    ASSERT_TRUE(BackupService(*target_).import_from_file(file).ok());
    ASSERT_EQ(target_->history()->size(), 1u);
    EXPECT_EQ(*target_->history()->front().text(), "on disk");
}

TEST_F(BackupServiceTest, ImportMissingFile) {
    auto result = BackupService(*target_).import_from_file(test_dir_ / "missing.json");
    EXPECT_EQ(result.error_code(), ErrorCode::NOT_FOUND);
}
