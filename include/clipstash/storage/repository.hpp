#pragma once

#include <clipstash/clipboard_item.hpp>
#include <clipstash/result.hpp>
#include <clipstash/settings.hpp>
#include <clipstash/snippet.hpp>

#include <vector>

namespace clipstash {

/**
 * Persistence ports, one per aggregate. Each repository exclusively owns
 * its files. Loading absent state yields an empty list or default
 * settings, never an error. Clearing absent state succeeds.
 */

class HistoryRepository {
public:
    virtual ~HistoryRepository() = default;

    /**
     * @param encrypted Which on-disk form the caller expects. When only
     *        the other form exists it is read instead.
     */
    virtual Result<std::vector<ClipboardItem>> load(bool encrypted) = 0;

    // Writes the chosen form and removes the other one
    virtual Result<void> save(const std::vector<ClipboardItem>& items, bool encrypted) = 0;

    // Removes both the plain and the encrypted form
    virtual Result<void> clear() = 0;
};

class PinnedRepository {
public:
    virtual ~PinnedRepository() = default;

    virtual Result<std::vector<PinnedItem>> load() = 0;
    virtual Result<void> save(const std::vector<PinnedItem>& pinned) = 0;
    virtual Result<void> clear() = 0;
};

class SnippetRepository {
public:
    virtual ~SnippetRepository() = default;

    virtual Result<std::vector<Snippet>> load() = 0;
    virtual Result<void> save(const std::vector<Snippet>& snippets) = 0;
    virtual Result<void> clear() = 0;
};

class SettingsRepository {
public:
    virtual ~SettingsRepository() = default;

    virtual Result<Settings> load() = 0;
    virtual Result<void> save(const Settings& settings) = 0;
    virtual Result<void> clear() = 0;
};

}  // namespace clipstash
