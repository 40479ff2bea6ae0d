#include "rm_command.hpp"

namespace clipstash::cli {

void RmCommand::setup(CLI::App& app) {
    app.add_option("item", ref_, "Position, id or id prefix")
        ->required()
        ->type_name("<ref>");
}

int RmCommand::execute(CommandContext& ctx) {
    auto item = resolve_item(*ctx.store, ref_);
    if (!item.ok()) {
        return report_error(item.error());
    }

    auto result = ctx.store->delete_item(item->id());
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Deleted " << short_id(item->id()) << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
