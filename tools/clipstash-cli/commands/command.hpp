#pragma once

#include "exit_codes.hpp"
#include "../platform/stdio_clipboard.hpp"

#include <clipstash/clipstash.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace clipstash::cli {

/**
 * Context passed to command execution.
 * Contains the opened store and the stdio clipboard adapters.
 */
struct CommandContext {
    ClipboardStore* store = nullptr;
    bool verbose = false;
    std::filesystem::path store_path;
    std::shared_ptr<StdinClipboardMonitor> monitor;
    std::shared_ptr<StdoutAutoPasteService> auto_paste;
    std::shared_ptr<Logger> logger;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with store and adapters
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Resolve the store directory: --store, then $CLIPSTASH_HOME,
 * then ~/.clipstash.
 */
inline std::filesystem::path get_default_store_path() {
    const char* env = std::getenv("CLIPSTASH_HOME");
    if (env && env[0] != '\0') {
        return std::filesystem::path(env);
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".clipstash";
    }
    return ".clipstash";
}

/**
 * Map an error to an exit code by its code and band.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::NOT_FOUND:
        case ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND:
        case ErrorCode::PINNED_ITEM_NOT_FOUND:
            return CLIPSTASH_EXIT_NOT_FOUND;
        default:
            break;
    }
    switch (error.band()) {
        case ErrorBand::GENERIC:
        case ErrorBand::DOMAIN:
            return CLIPSTASH_EXIT_USER_ERROR;
        case ErrorBand::INFRASTRUCTURE:
            return CLIPSTASH_EXIT_IO_ERROR;
        default:
            return CLIPSTASH_EXIT_INTERNAL;
    }
}

// Print to stderr and return the matching exit code
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Resolve an item reference against the current history and pins.
 *
 * Accepts a 1-based history position, a full item id, or a unique
 * id prefix (as printed by `list`).
 */
inline Result<ClipboardItem> resolve_item(const ClipboardStore& store, const std::string& ref) {
    if (ref.empty()) {
        return Error(ErrorCode::VALIDATION_ERROR, "Empty item reference");
    }

    auto history = store.history();

    if (ref.find_first_not_of("0123456789") == std::string::npos && ref.size() < 6) {
        size_t index = static_cast<size_t>(std::stoul(ref));
        if (index >= 1 && index <= history->size()) {
            return (*history)[index - 1];
        }
    }

    if (auto exact = store.find_item(ref)) {
        return *exact;
    }

    std::optional<ClipboardItem> match;
    auto consider = [&](const ClipboardItem& item) -> bool {
        if (item.id().compare(0, ref.size(), ref) != 0) return true;
        if (match && match->id() != item.id()) return false;
        match = item;
        return true;
    };
    for (const auto& item : *history) {
        if (!consider(item)) {
            return Error(ErrorCode::VALIDATION_ERROR, "Ambiguous item reference: " + ref);
        }
    }
    for (const auto& pin : *store.pinned()) {
        if (!consider(pin.item)) {
            return Error(ErrorCode::VALIDATION_ERROR, "Ambiguous item reference: " + ref);
        }
    }
    if (match) {
        return *match;
    }
    return Error(ErrorCode::CLIPBOARD_HISTORY_ITEM_NOT_FOUND, "Item not found: " + ref);
}

/**
 * Resolve a snippet by id, id prefix or exact title.
 */
inline Result<Snippet> resolve_snippet(const ClipboardStore& store, const std::string& ref) {
    auto snippets = store.snippets();
    for (const auto& s : *snippets) {
        if (s.id == ref) return s;
    }
    std::optional<Snippet> match;
    for (const auto& s : *snippets) {
        if (s.id.compare(0, ref.size(), ref) == 0 || s.title == ref) {
            if (match) {
                return Error(ErrorCode::VALIDATION_ERROR, "Ambiguous snippet reference: " + ref);
            }
            match = s;
        }
    }
    if (match) {
        return *match;
    }
    return Error(ErrorCode::NOT_FOUND, "Snippet not found: " + ref);
}

/**
 * Read entire file content.
 * @return File content if successful, std::nullopt on error
 */
inline std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return std::nullopt;
    }
    return ss.str();
}

inline std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

/**
 * Truncate a string for display, adding "..." if needed.
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

// Short id used in listings
inline std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

}  // namespace clipstash::cli
