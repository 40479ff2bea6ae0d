#include "pin_command.hpp"

namespace clipstash::cli {

void PinCommand::setup(CLI::App& app) {
    app.add_option("item", ref_, "Item position/id, or pin id with --remove/--rename")
        ->required()
        ->type_name("<ref>");

    app.add_option("-t,--title", title_, "Custom title")
        ->type_name("<title>");

    auto* remove = app.add_flag("-r,--remove", remove_, "Unpin");
    auto* toggle = app.add_flag("--toggle", toggle_, "Pin if unpinned, otherwise unpin");
    auto* rename = app.add_flag("--rename", rename_, "Change the custom title of a pin");

    remove->excludes(toggle)->excludes(rename);
    toggle->excludes(rename);
}

int PinCommand::execute(CommandContext& ctx) {
    if (rename_) {
        std::string pin_id = ref_;
        for (const auto& pin : *ctx.store->pinned()) {
            if (pin.id.compare(0, ref_.size(), ref_) == 0 ||
                pin.item.id().compare(0, ref_.size(), ref_) == 0) {
                pin_id = pin.id;
                break;
            }
        }
        auto result = ctx.store->rename_pin(pin_id, title_);
        if (!result.ok()) {
            return report_error(result.error());
        }
        std::cout << "Renamed pin " << short_id(pin_id) << "\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    if (remove_) {
        std::string id = ref_;
        for (const auto& pin : *ctx.store->pinned()) {
            if (pin.id.compare(0, ref_.size(), ref_) == 0) {
                id = pin.id;
                break;
            }
            if (pin.item.id().compare(0, ref_.size(), ref_) == 0) {
                id = pin.item.id();
                break;
            }
        }
        auto result = ctx.store->unpin_item(id);
        if (!result.ok()) {
            return report_error(result.error());
        }
        std::cout << "Unpinned " << short_id(id) << "\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    auto item = resolve_item(*ctx.store, ref_);
    if (!item.ok()) {
        return report_error(item.error());
    }

    if (toggle_) {
        auto result = ctx.store->toggle_pin(item->id());
        if (!result.ok()) {
            return report_error(result.error());
        }
        std::cout << (*result ? "Pinned " : "Unpinned ") << short_id(item->id()) << "\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    std::optional<std::string> title;
    if (!title_.empty()) {
        title = title_;
    }
    auto result = ctx.store->pin_item(item->id(), title);
    if (!result.ok()) {
        return report_error(result.error());
    }
    std::cout << "Pinned " << short_id(item->id()) << " as " << short_id(result->id) << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
