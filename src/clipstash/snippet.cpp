#include <clipstash/snippet.hpp>
#include <clipstash/util/uuid.hpp>

#include <unordered_set>

namespace clipstash {

Snippet Snippet::create(std::string title, std::string content, std::string category) {
    Snippet snippet;
    snippet.id = generate_uuid();
    snippet.title = std::move(title);
    snippet.content = std::move(content);
    snippet.category = std::move(category);
    snippet.created_at = now_millis();
    return snippet;
}

std::vector<std::string> Snippet::placeholders() const {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;

    size_t pos = 0;
    while (pos < content.size()) {
        size_t open = content.find('{', pos);
        if (open == std::string::npos) break;

        size_t close = content.find('}', open + 1);
        if (close == std::string::npos) break;

        // "{a{b}" yields "a{b", matching [^}]+
        if (close > open + 1) {
            std::string name = content.substr(open + 1, close - open - 1);
            if (seen.insert(name).second) {
                names.push_back(std::move(name));
            }
        }
        pos = close + 1;
    }

    return names;
}

std::string Snippet::resolve(const std::map<std::string, std::string>& values) const {
    std::string output = content;
    for (const auto& [key, value] : values) {
        const std::string token = "{" + key + "}";
        size_t pos = 0;
        while ((pos = output.find(token, pos)) != std::string::npos) {
            output.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return output;
}

}  // namespace clipstash
