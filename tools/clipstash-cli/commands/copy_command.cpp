#include "copy_command.hpp"

namespace clipstash::cli {

void CopyCommand::setup(CLI::App& app) {
    app.add_option("item", ref_, "Position, id or id prefix")
        ->required()
        ->type_name("<ref>");

    app.add_flag("--paste", paste_, "Also paste into the previous window");
}

int CopyCommand::execute(CommandContext& ctx) {
    auto item = resolve_item(*ctx.store, ref_);
    if (!item.ok()) {
        return report_error(item.error());
    }

    auto result = paste_ ? ctx.store->paste_item(item->id())
                         : ctx.store->select_item(item->id());
    if (!result.ok()) {
        return report_error(result.error());
    }
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
