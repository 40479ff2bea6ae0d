#include <clipstash/flush_worker.hpp>

#include <algorithm>

namespace clipstash {

namespace {

constexpr size_t HISTORY_SLOT = 0;
constexpr size_t PINNED_SLOT = 1;
constexpr size_t SNIPPETS_SLOT = 2;

}  // namespace

FlushWorker::FlushWorker(std::shared_ptr<HistoryRepository> history,
                         std::shared_ptr<PinnedRepository> pinned,
                         std::shared_ptr<SnippetRepository> snippets,
                         std::shared_ptr<Logger> logger,
                         Duration coalesce_delay)
    : history_repo_(std::move(history))
    , pinned_repo_(std::move(pinned))
    , snippet_repo_(std::move(snippets))
    , logger_(logger ? std::move(logger) : std::make_shared<NullLogger>())
    , coalesce_delay_(coalesce_delay)
{
    thread_ = std::thread(&FlushWorker::run, this);
}

FlushWorker::~FlushWorker() {
    stop();
}

void FlushWorker::schedule(FlushSnapshot snapshot, uint32_t targets) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            logger_->warning("Flush scheduled after shutdown was ignored");
            return;
        }
        pending_ = std::move(snapshot);
        pending_targets_ |= targets | failed_targets_;
        failed_targets_ = FLUSH_NONE;
    }
    wake_cv_.notify_one();
}

Result<void> FlushWorker::write_now(const FlushSnapshot& snapshot, uint32_t targets) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_targets_ &= ~targets;
        failed_targets_ &= ~targets;
    }

    Error error;
    uint32_t failed = write(snapshot, targets, true, &error);
    if (failed != FLUSH_NONE) {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_targets_ |= failed;
        return error;
    }
    return Ok();
}

Result<void> FlushWorker::clear_now(uint32_t targets, uint64_t generation) {
    std::lock_guard<std::mutex> io(io_mutex_);
    auto clear = [&](FlushTarget target, size_t slot, const char* name,
                     auto remove) -> Result<void> {
        if (!(targets & target)) {
            return Ok();
        }
        Result<void> result = remove();
        if (!result.ok()) {
            logger_->error(std::string("Failed to clear ") + name + ": " +
                           result.error().to_string());
            return result;
        }
        written_generation_[slot] = std::max(written_generation_[slot], generation);
        return Ok();
    };

    Result<void> result = clear(FLUSH_HISTORY, HISTORY_SLOT, "history", [&]() -> Result<void> {
        return history_repo_ ? history_repo_->clear() : Ok();
    });
    if (result.ok()) {
        result = clear(FLUSH_PINNED, PINNED_SLOT, "pinned items", [&]() -> Result<void> {
            return pinned_repo_ ? pinned_repo_->clear() : Ok();
        });
    }
    if (result.ok()) {
        result = clear(FLUSH_SNIPPETS, SNIPPETS_SLOT, "snippets", [&]() -> Result<void> {
            return snippet_repo_ ? snippet_repo_->clear() : Ok();
        });
    }
    if (!result.ok()) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_targets_ &= ~targets;
        failed_targets_ &= ~targets;
    }
    idle_cv_.notify_all();
    return Ok();
}

Result<void> FlushWorker::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_targets_ == FLUSH_NONE && !in_progress_;
    });

    Error error = last_error_;
    last_error_ = Error();
    if (error) {
        return error;
    }
    return Ok();
}

void FlushWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

uint32_t FlushWorker::failed_targets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_targets_;
}

void FlushWorker::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_cv_.wait(lock, [this] {
            return stopping_ || pending_targets_ != FLUSH_NONE;
        });
        if (pending_targets_ == FLUSH_NONE) {
            if (stopping_) break;
            continue;
        }

        if (coalesce_delay_.count() > 0 && !stopping_) {
            wake_cv_.wait_for(lock, coalesce_delay_, [this] { return stopping_; });
        }
        // write_now may have taken the work while we waited
        if (pending_targets_ == FLUSH_NONE) {
            idle_cv_.notify_all();
            continue;
        }

        FlushSnapshot snapshot = pending_;
        uint32_t targets = pending_targets_;
        pending_targets_ = FLUSH_NONE;
        in_progress_ = true;
        lock.unlock();

        Error error;
        uint32_t failed = write(snapshot, targets, false, &error);

        lock.lock();
        in_progress_ = false;
        if (failed != FLUSH_NONE) {
            failed_targets_ |= failed;
            last_error_ = error;
        }
        idle_cv_.notify_all();
    }

    if (failed_targets_ != FLUSH_NONE) {
        logger_->warning("Shutting down with unsaved state (targets " +
                         std::to_string(failed_targets_) + ")");
    }
    idle_cv_.notify_all();
}

uint32_t FlushWorker::write(const FlushSnapshot& snapshot, uint32_t targets,
                            bool authoritative, Error* last_error) {
    std::lock_guard<std::mutex> io(io_mutex_);
    uint32_t failed = FLUSH_NONE;

    auto attempt = [&](FlushTarget target, size_t slot, const char* name, auto save) {
        if (!(targets & target)) {
            return;
        }
        if (!authoritative && snapshot.generation < written_generation_[slot]) {
            logger_->debug(std::string("Skipping stale ") + name + " flush");
            return;
        }
        Result<void> result = save();
        if (!result.ok()) {
            failed |= target;
            *last_error = result.error();
            logger_->error(std::string("Failed to persist ") + name + ": " +
                           result.error().to_string());
            return;
        }
        written_generation_[slot] = snapshot.generation;
    };

    attempt(FLUSH_HISTORY, HISTORY_SLOT, "history", [&]() -> Result<void> {
        if (!history_repo_ || !snapshot.history) return Ok();
        if (!snapshot.remember_history) {
            logger_->debug("History recording is off, leaving stored history as is");
            return Ok();
        }
        return history_repo_->save(*snapshot.history, snapshot.encrypt_history);
    });
    attempt(FLUSH_PINNED, PINNED_SLOT, "pinned items", [&]() -> Result<void> {
        if (!pinned_repo_ || !snapshot.pinned) return Ok();
        return pinned_repo_->save(*snapshot.pinned);
    });
    attempt(FLUSH_SNIPPETS, SNIPPETS_SLOT, "snippets", [&]() -> Result<void> {
        if (!snippet_repo_ || !snapshot.snippets) return Ok();
        return snippet_repo_->save(*snapshot.snippets);
    });

    return failed;
}

}  // namespace clipstash
