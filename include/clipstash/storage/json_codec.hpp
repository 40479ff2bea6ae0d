#pragma once

#include <clipstash/clipboard_item.hpp>
#include <clipstash/result.hpp>
#include <clipstash/settings.hpp>
#include <clipstash/snippet.hpp>
#include <clipstash/types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace clipstash {
namespace storage {

using json = nlohmann::json;

/**
 * JSON mapping for persisted records.
 *
 * Enums are written as lowercase names, binary payloads as base64 and
 * timestamps as epoch milliseconds. Decoders report malformed JSON as
 * DESERIALIZATION_FAILED and well-formed JSON with a bad shape (missing
 * field, unknown type, payload that does not match its type) as
 * DATA_FORMAT_INVALID.
 */

json item_to_json(const ClipboardItem& item);
Result<ClipboardItem> item_from_json(const json& j);

json pinned_to_json(const PinnedItem& pinned);
Result<PinnedItem> pinned_from_json(const json& j);

json snippet_to_json(const Snippet& snippet);
Result<Snippet> snippet_from_json(const json& j);

json settings_to_json(const Settings& settings);
// Missing fields keep their defaults
Result<Settings> settings_from_json(const json& j);

std::string encode_history(const std::vector<ClipboardItem>& items);
Result<std::vector<ClipboardItem>> decode_history(const std::string& data);

std::string encode_pinned(const std::vector<PinnedItem>& pinned);
Result<std::vector<PinnedItem>> decode_pinned(const std::string& data);

std::string encode_snippets(const std::vector<Snippet>& snippets);
Result<std::vector<Snippet>> decode_snippets(const std::string& data);

std::string encode_settings(const Settings& settings);
Result<Settings> decode_settings(const std::string& data);

std::string encode_backup(const BackupPayload& payload);
// Decodes any version; callers check BackupPayload::version
Result<BackupPayload> decode_backup(const std::string& data);

}  // namespace storage
}  // namespace clipstash
