#pragma once

#include <clipstash/auto_paste_service.hpp>
#include <clipstash/clipboard_monitor.hpp>
#include <clipstash/util/logger.hpp>

#include <atomic>
#include <condition_variable>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace clipstash::cli {

/**
 * Clipboard monitor fed by a file descriptor (stdin by default).
 *
 * Every non-empty line is classified and delivered as one capture with
 * source application "stdin". Reads poll so stop() never blocks on a
 * pending read.
 */
class StdinClipboardMonitor : public ClipboardMonitor {
public:
    explicit StdinClipboardMonitor(int fd = 0, std::shared_ptr<Logger> logger = nullptr);
    ~StdinClipboardMonitor() override;

    Result<void> start(CaptureCallback callback, bool capture_rich_text) override;
    Result<void> update_capture_rich_text(bool capture_rich_text) override;
    Result<void> stop() override;

    // Block until the input reaches end of file or stop() is called
    void wait_until_closed();

    size_t captured_count() const { return captured_.load(); }

private:
    void run();
    void deliver(const std::string& line);

    int fd_;
    std::shared_ptr<Logger> logger_;
    CaptureCallback callback_;

    std::thread thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> captured_{0};

    std::mutex mutex_;
    std::condition_variable closed_cv_;
    bool closed_ = false;
};

/**
 * Clipboard writer that prints the selected item to an output stream.
 * Image items print their size instead of raw bytes.
 */
class StdoutAutoPasteService : public AutoPasteService {
public:
    explicit StdoutAutoPasteService(std::ostream& out);

    Result<void> set_clipboard_content(const ClipboardItem& item) override;

    // No window system to paste into; a no-op
    Result<void> paste_to_previous_window() override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

}  // namespace clipstash::cli
