#pragma once

namespace clipstash::cli {

// Standard exit codes for CLI commands
// Named with CLIPSTASH_ prefix to avoid conflict with system macros
constexpr int CLIPSTASH_EXIT_SUCCESS = 0;
constexpr int CLIPSTASH_EXIT_USER_ERROR = 1;     // Invalid arguments, rejected values
constexpr int CLIPSTASH_EXIT_NOT_FOUND = 2;      // Item/pin/snippet not found
constexpr int CLIPSTASH_EXIT_IO_ERROR = 3;       // Storage/encryption errors
constexpr int CLIPSTASH_EXIT_INTERNAL = 4;       // Internal/unexpected errors

}  // namespace clipstash::cli
