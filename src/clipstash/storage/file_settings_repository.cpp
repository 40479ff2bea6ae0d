#include <clipstash/storage/file_repositories.hpp>
#include <clipstash/storage/file_util.hpp>
#include <clipstash/storage/json_codec.hpp>

namespace clipstash {

FileSettingsRepository::FileSettingsRepository(StoragePaths paths, std::shared_ptr<Logger> logger)
    : paths_(std::move(paths))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
{}

Result<Settings> FileSettingsRepository::load() {
    auto data = storage::read_file(paths_.settings_json);
    if (!data.ok()) {
        return data.error();
    }
    if (!data->has_value() || (*data)->empty()) {
        return Settings();
    }
    return storage::decode_settings(**data);
}

Result<void> FileSettingsRepository::save(const Settings& settings) {
    auto written = storage::write_file_atomic(paths_.settings_json,
                                              storage::encode_settings(settings));
    if (!written.ok()) {
        return written;
    }
    logger_->debug("Saved settings to " + paths_.settings_json.string());
    return Ok();
}

// The next load() yields default settings
Result<void> FileSettingsRepository::clear() {
    return storage::remove_file(paths_.settings_json);
}

}  // namespace clipstash
