#include <clipstash/storage/file_repositories.hpp>
#include <clipstash/storage/file_util.hpp>
#include <clipstash/storage/json_codec.hpp>

#include <algorithm>

namespace clipstash {

FilePinnedRepository::FilePinnedRepository(StoragePaths paths, std::shared_ptr<Logger> logger)
    : paths_(std::move(paths))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
{}

Result<std::vector<PinnedItem>> FilePinnedRepository::load() {
    auto data = storage::read_file(paths_.pinned_json);
    if (!data.ok()) {
        return data.error();
    }
    if (!data->has_value() || (*data)->empty()) {
        return std::vector<PinnedItem>();
    }

    auto pinned = storage::decode_pinned(**data);
    if (!pinned.ok()) {
        return pinned.error();
    }
    if (pinned->size() > limits::MAX_PINNED_ITEMS) {
        logger_->warning("Pinned file holds " + std::to_string(pinned->size()) +
                         " items, keeping the first " +
                         std::to_string(limits::MAX_PINNED_ITEMS));
        pinned->erase(pinned->begin() + limits::MAX_PINNED_ITEMS, pinned->end());
    }
    return pinned;
}

Result<void> FilePinnedRepository::save(const std::vector<PinnedItem>& pinned) {
    size_t count = std::min(pinned.size(), limits::MAX_PINNED_ITEMS);
    std::vector<PinnedItem> capped(pinned.begin(), pinned.begin() + count);

    auto written = storage::write_file_atomic(paths_.pinned_json, storage::encode_pinned(capped));
    if (!written.ok()) {
        return written;
    }
    logger_->debug("Saved " + std::to_string(count) + " pinned items");
    return Ok();
}

Result<void> FilePinnedRepository::clear() {
    auto removed = storage::remove_file(paths_.pinned_json);
    if (!removed.ok()) {
        return removed;
    }
    logger_->debug("Removed " + paths_.pinned_json.string());
    return Ok();
}

}  // namespace clipstash
