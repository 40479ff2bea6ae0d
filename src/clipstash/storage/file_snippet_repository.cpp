#include <clipstash/storage/file_repositories.hpp>
#include <clipstash/storage/file_util.hpp>
#include <clipstash/storage/json_codec.hpp>

namespace clipstash {

FileSnippetRepository::FileSnippetRepository(StoragePaths paths, std::shared_ptr<Logger> logger)
    : paths_(std::move(paths))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
{}

Result<std::vector<Snippet>> FileSnippetRepository::load() {
    auto data = storage::read_file(paths_.snippets_json);
    if (!data.ok()) {
        return data.error();
    }
    if (!data->has_value() || (*data)->empty()) {
        return std::vector<Snippet>();
    }

    auto snippets = storage::decode_snippets(**data);
    if (!snippets.ok()) {
        return snippets.error();
    }
    if (snippets->size() > limits::MAX_SNIPPETS) {
        snippets->erase(snippets->begin() + limits::MAX_SNIPPETS, snippets->end());
    }
    return snippets;
}

Result<void> FileSnippetRepository::save(const std::vector<Snippet>& snippets) {
    auto written = storage::write_file_atomic(paths_.snippets_json,
                                              storage::encode_snippets(snippets));
    if (!written.ok()) {
        return written;
    }
    logger_->debug("Saved " + std::to_string(snippets.size()) + " snippets");
    return Ok();
}

Result<void> FileSnippetRepository::clear() {
    auto removed = storage::remove_file(paths_.snippets_json);
    if (!removed.ok()) {
        return removed;
    }
    logger_->debug("Removed " + paths_.snippets_json.string());
    return Ok();
}

}  // namespace clipstash
