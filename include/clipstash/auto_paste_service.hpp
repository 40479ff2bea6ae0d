#pragma once

#include <clipstash/clipboard_item.hpp>
#include <clipstash/result.hpp>

namespace clipstash {

/**
 * AutoPasteService - Writes items back to the system clipboard and
 * optionally pastes into the previously focused window.
 */
class AutoPasteService {
public:
    virtual ~AutoPasteService() = default;

    virtual Result<void> set_clipboard_content(const ClipboardItem& item) = 0;
    virtual Result<void> paste_to_previous_window() = 0;
};

}  // namespace clipstash
