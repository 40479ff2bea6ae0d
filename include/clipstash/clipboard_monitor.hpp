#pragma once

#include <clipstash/clipboard_item.hpp>
#include <clipstash/result.hpp>

#include <functional>

namespace clipstash {

// Invoked once per capture; the monitor never runs two callbacks at once
using CaptureCallback = std::function<Result<void>(ClipboardItem)>;

/**
 * ClipboardMonitor - Source of clipboard captures.
 *
 * Platform bindings implement this; the store subscribes through
 * start() and routes every capture into ClipboardStore::add_item.
 */
class ClipboardMonitor {
public:
    virtual ~ClipboardMonitor() = default;

    /**
     * Begin delivering captures.
     *
     * @param capture_rich_text Whether RTF/HTML flavors are captured as
     *        RICH_TEXT items instead of plain text
     */
    virtual Result<void> start(CaptureCallback callback, bool capture_rich_text) = 0;

    virtual Result<void> update_capture_rich_text(bool capture_rich_text) = 0;

    virtual Result<void> stop() = 0;
};

}  // namespace clipstash
