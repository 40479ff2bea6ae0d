#pragma once

#include <clipstash/clipboard_item.hpp>
#include <clipstash/result.hpp>
#include <clipstash/snippet.hpp>
#include <clipstash/storage/repository.hpp>
#include <clipstash/util/logger.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace clipstash {

enum FlushTarget : uint32_t {
    FLUSH_NONE = 0,
    FLUSH_HISTORY = 1u << 0,
    FLUSH_PINNED = 1u << 1,
    FLUSH_SNIPPETS = 1u << 2,
    FLUSH_ALL = FLUSH_HISTORY | FLUSH_PINNED | FLUSH_SNIPPETS
};

/**
 * Immutable view of every persisted aggregate at one generation.
 */
struct FlushSnapshot {
    uint64_t generation = 0;
    std::shared_ptr<const std::vector<ClipboardItem>> history;
    std::shared_ptr<const std::vector<PinnedItem>> pinned;
    std::shared_ptr<const std::vector<Snippet>> snippets;
    bool encrypt_history = false;
    // While false the history target is left untouched on disk
    bool remember_history = true;
};

/**
 * FlushWorker - Background persistence with a single pending slot.
 *
 * schedule() replaces the pending snapshot and ORs in the dirty targets,
 * so a burst of mutations collapses into one write of the latest state.
 * Writes are serialized; a target is never overwritten by a snapshot
 * older than the one last written for it. Failed targets are logged and
 * retried with the next schedule().
 *
 * Usage:
 *   FlushWorker worker(history_repo, pinned_repo, snippet_repo, logger);
 *   worker.schedule(snapshot, FLUSH_HISTORY);
 *   worker.flush();   // wait for the write
 */
class FlushWorker {
public:
    using Duration = std::chrono::milliseconds;

    /**
     * @param coalesce_delay How long the worker waits after being woken
     *        before taking the pending snapshot
     */
    FlushWorker(std::shared_ptr<HistoryRepository> history,
                std::shared_ptr<PinnedRepository> pinned,
                std::shared_ptr<SnippetRepository> snippets,
                std::shared_ptr<Logger> logger,
                Duration coalesce_delay = Duration(0));

    ~FlushWorker();

    FlushWorker(const FlushWorker&) = delete;
    FlushWorker& operator=(const FlushWorker&) = delete;

    void schedule(FlushSnapshot snapshot, uint32_t targets);

    /**
     * Write the given targets on the calling thread, bypassing the slot.
     * The snapshot replaces whatever is on disk for those targets and
     * pending work for them is discarded.
     */
    Result<void> write_now(const FlushSnapshot& snapshot, uint32_t targets);

    /**
     * Remove the stored state of the given targets on the calling thread.
     * On success pending and failed work for them is discarded, and
     * background snapshots older than generation are no longer written.
     */
    Result<void> clear_now(uint32_t targets, uint64_t generation);

    /**
     * Block until every scheduled flush has been attempted.
     *
     * @return The most recent flush error since the last call, if any
     */
    Result<void> flush();

    // Drain pending work and join the thread. Idempotent.
    void stop();

    // Targets whose last write failed and are waiting for a retry
    uint32_t failed_targets() const;

private:
    void run();
    // Background writes (authoritative == false) skip targets already
    // written from a newer generation
    uint32_t write(const FlushSnapshot& snapshot, uint32_t targets,
                   bool authoritative, Error* last_error);

    std::shared_ptr<HistoryRepository> history_repo_;
    std::shared_ptr<PinnedRepository> pinned_repo_;
    std::shared_ptr<SnippetRepository> snippet_repo_;
    std::shared_ptr<Logger> logger_;
    Duration coalesce_delay_;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    FlushSnapshot pending_;
    uint32_t pending_targets_ = FLUSH_NONE;
    uint32_t failed_targets_ = FLUSH_NONE;
    bool in_progress_ = false;
    bool stopping_ = false;
    Error last_error_;

    // Serializes repository writes; guards written_generation_
    std::mutex io_mutex_;
    uint64_t written_generation_[3] = {0, 0, 0};

    std::thread thread_;
};

}  // namespace clipstash
