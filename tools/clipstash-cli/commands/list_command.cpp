#include "list_command.hpp"

#include <ctime>
#include <iomanip>

namespace clipstash::cli {

namespace {

std::string format_time(Timestamp ts) {
    std::time_t t = Clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return out.str();
}

std::string one_line(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return out;
}

void print_header() {
    std::cout << std::left
              << std::setw(5) << "#"
              << std::setw(10) << "ID"
              << std::setw(11) << "TYPE"
              << std::setw(18) << "CAPTURED"
              << "CONTENT\n";
    std::cout << std::string(80, '-') << "\n";
}

}  // namespace

void ListCommand::setup(CLI::App& app) {
    app.add_flag("-p,--pinned", pinned_, "List pinned items only");
    app.add_flag("-a,--all", all_, "List pinned items and history");
    app.add_option("-n,--limit", limit_, "Show at most this many history items")
        ->type_name("<count>");
}

int ListCommand::execute(CommandContext& ctx) {
    if (pinned_ || all_) {
        auto pinned = ctx.store->pinned();
        std::cout << "Pinned (" << pinned->size() << ")\n";
        std::cout << std::left
                  << std::setw(10) << "PIN"
                  << std::setw(10) << "ITEM"
                  << std::setw(11) << "TYPE"
                  << "TITLE\n";
        std::cout << std::string(80, '-') << "\n";
        for (const auto& pin : *pinned) {
            std::cout << std::left
                      << std::setw(10) << short_id(pin.id)
                      << std::setw(10) << short_id(pin.item.id())
                      << std::setw(11) << item_type_name(pin.item.type())
                      << truncate(one_line(pin.display_title()), 49) << "\n";
        }
        if (!all_) {
            return CLIPSTASH_EXIT_SUCCESS;
        }
        std::cout << "\n";
    }

    auto history = ctx.store->history();
    if (history->empty()) {
        std::cout << "History is empty.\n";
        std::cout << "Use 'clipstash add' or 'clipstash watch' to capture something.\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    auto active = ctx.store->active_item();
    print_header();

    size_t shown = 0;
    for (size_t i = 0; i < history->size(); ++i) {
        if (limit_ > 0 && shown >= limit_) break;
        const auto& item = (*history)[i];
        bool is_active = active && active->id() == item.id();

        std::cout << std::left
                  << std::setw(5) << (std::to_string(i + 1) + (is_active ? "*" : ""))
                  << std::setw(10) << short_id(item.id())
                  << std::setw(11) << item_type_name(item.type())
                  << std::setw(18) << format_time(item.timestamp())
                  << truncate(one_line(item.display_string()), 36) << "\n";
        ++shown;
    }

    std::cout << "\n" << history->size() << " item(s)";
    auto settings = ctx.store->settings();
    if (settings.incognito_mode) std::cout << " [incognito]";
    if (!settings.remember_history) std::cout << " [history off]";
    std::cout << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
