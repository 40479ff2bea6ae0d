#pragma once

/**
 * Clipstash
 *
 * Clipboard history manager: captures clipboard changes, keeps a bounded
 * history with pins and snippets, and persists it under a local directory.
 */

#include <clipstash/types.hpp>
#include <clipstash/clipboard_store.hpp>
#include <clipstash/item_classifier.hpp>
#include <clipstash/backup_service.hpp>
#include <clipstash/quick_actions.hpp>
