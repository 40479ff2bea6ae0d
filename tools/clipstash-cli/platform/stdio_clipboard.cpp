#include "stdio_clipboard.hpp"

#include <clipstash/item_classifier.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <ostream>
#include <sys/select.h>
#include <unistd.h>

namespace clipstash::cli {

namespace {

constexpr int SELECT_INTERVAL_MS = 100;
constexpr const char* STDIN_SOURCE = "stdin";

}  // namespace

// ============================================================================
// StdinClipboardMonitor
// ============================================================================

StdinClipboardMonitor::StdinClipboardMonitor(int fd, std::shared_ptr<Logger> logger)
    : fd_(fd), logger_(logger ? std::move(logger) : std::make_shared<NullLogger>()) {}

StdinClipboardMonitor::~StdinClipboardMonitor() {
    auto result = stop();
    if (!result.ok()) {
        logger_->warning("Monitor stop failed: " + result.error().to_string());
    }
}

Result<void> StdinClipboardMonitor::start(CaptureCallback callback, bool /* capture_rich_text */) {
    if (thread_.joinable()) {
        return Error(ErrorCode::CLIPBOARD_MONITOR_START_FAILED, "Monitor is already running");
    }
    if (!callback) {
        return Error(ErrorCode::CLIPBOARD_MONITOR_START_FAILED, "No capture callback");
    }

    callback_ = std::move(callback);
    stop_requested_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    try {
        thread_ = std::thread(&StdinClipboardMonitor::run, this);
    } catch (const std::system_error& e) {
        return Error(ErrorCode::CLIPBOARD_MONITOR_START_FAILED,
                     std::string("Cannot start reader thread: ") + e.what());
    }
    return Ok();
}

Result<void> StdinClipboardMonitor::update_capture_rich_text(bool /* capture_rich_text */) {
    // Plain lines only
    return Ok();
}

Result<void> StdinClipboardMonitor::stop() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            return Error(ErrorCode::INVALID_OPERATION, "Monitor cannot stop itself");
        }
        thread_.join();
    }
    return Ok();
}

void StdinClipboardMonitor::wait_until_closed() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_cv_.wait(lock, [this] { return closed_; });
}

void StdinClipboardMonitor::run() {
    std::string pending;
    char buffer[4096];

    while (!stop_requested_) {
        // select() with a timeout so stop() is noticed
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd_, &fds);

        struct timeval tv = {0, SELECT_INTERVAL_MS * 1000};

        int ready = select(fd_ + 1, &fds, nullptr, nullptr, &tv);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_->error(std::string("select failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            logger_->error(std::string("read failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            deliver(line);
        }
    }

    if (!pending.empty() && !stop_requested_) {
        deliver(pending);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    closed_cv_.notify_all();
}

void StdinClipboardMonitor::deliver(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    if (text.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    ItemSource source;
    source.app_id = STDIN_SOURCE;
    auto item = ClipboardItem::make_text(text, ItemClassifier::classify(text), source);

    auto result = callback_(std::move(item));
    if (!result.ok()) {
        logger_->warning("Capture rejected: " + result.error().to_string());
        return;
    }
    ++captured_;
}

// ============================================================================
// StdoutAutoPasteService
// ============================================================================

StdoutAutoPasteService::StdoutAutoPasteService(std::ostream& out) : out_(out) {}

Result<void> StdoutAutoPasteService::set_clipboard_content(const ClipboardItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* bytes = item.image_bytes()) {
        out_ << "<image " << bytes->size() << " bytes>\n";
    } else if (auto text = item.text_view()) {
        out_ << *text << "\n";
    } else {
        return Error(ErrorCode::CLIPBOARD_ITEM_UNSUPPORTED_TYPE, "Item has no printable content");
    }

    out_.flush();
    if (!out_) {
        return Error(ErrorCode::STORAGE_WRITE_FAILED, "Cannot write to output stream");
    }
    return Ok();
}

Result<void> StdoutAutoPasteService::paste_to_previous_window() {
    // The printed content is the paste
    return Ok();
}

}  // namespace clipstash::cli
