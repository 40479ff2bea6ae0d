#pragma once

#include <clipstash/core_types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clipstash {

/**
 * Snippet - Reusable text template with {name} placeholders.
 */
struct Snippet {
    SnippetId id;
    std::string title;
    std::string content;
    std::string category;
    Timestamp created_at;
    std::optional<Timestamp> last_used_at;

    static Snippet create(std::string title, std::string content, std::string category = "");

    /**
     * Placeholder names in order of first appearance, without duplicates.
     * A placeholder is '{', one or more characters other than '}', then '}'.
     */
    std::vector<std::string> placeholders() const;

    /**
     * Replace each "{key}" with its value. Placeholders without a value
     * are left verbatim.
     */
    std::string resolve(const std::map<std::string, std::string>& values) const;

    bool operator==(const Snippet& other) const {
        return id == other.id && title == other.title && content == other.content &&
               category == other.category && created_at == other.created_at &&
               last_used_at == other.last_used_at;
    }
};

}  // namespace clipstash
