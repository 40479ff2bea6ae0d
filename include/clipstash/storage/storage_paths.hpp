#pragma once

#include <filesystem>

namespace clipstash {

/**
 * File layout under the store root.
 */
struct StoragePaths {
    explicit StoragePaths(std::filesystem::path root_directory)
        : root(std::move(root_directory))
        , history_json(root / "history.json")
        , history_encrypted(root / "history.json.enc")
        , pinned_json(root / "pinned.json")
        , snippets_json(root / "snippets.json")
        , settings_json(root / "settings.json")
        , key_file(root / "history.key")
    {}

    std::filesystem::path root;
    std::filesystem::path history_json;
    std::filesystem::path history_encrypted;
    std::filesystem::path pinned_json;
    std::filesystem::path snippets_json;
    std::filesystem::path settings_json;
    std::filesystem::path key_file;
};

}  // namespace clipstash
