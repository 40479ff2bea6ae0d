#pragma once

#include <clipstash/result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace clipstash {
namespace storage {

/**
 * Read a whole file. A missing file is not an error and yields
 * std::nullopt.
 *
 * @return STORAGE_ACCESS_DENIED or STORAGE_READ_FAILED on I/O failure
 */
Result<std::optional<std::string>> read_file(const std::filesystem::path& path);

/**
 * Replace a file atomically: write a sibling temp file, fsync it, then
 * rename it over the target. Creates the parent directory if needed.
 */
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& data);

// Remove a file if present
Result<void> remove_file(const std::filesystem::path& path);

Result<void> ensure_directory(const std::filesystem::path& dir);

// Map a failed filesystem call to a storage error code
ErrorCode map_io_error(const std::error_code& ec, ErrorCode fallback);

}  // namespace storage
}  // namespace clipstash
