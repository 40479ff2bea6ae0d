#include "action_command.hpp"

namespace clipstash::cli {

void ActionCommand::setup(CLI::App& app) {
    app.add_option("item", ref_, "Position, id or id prefix")
        ->required()
        ->type_name("<ref>");

    app.add_option("action", action_, "base64, url-encode, url-decode, save or edit")
        ->required()
        ->check(CLI::IsMember({"base64", "url-encode", "url-decode", "save", "edit"}));

    app.add_option("argument", argument_, "Destination for save, new text for edit");
}

int ActionCommand::execute(CommandContext& ctx) {
    auto item = resolve_item(*ctx.store, ref_);
    if (!item.ok()) {
        return report_error(item.error());
    }

    QuickActions actions(*ctx.store, ctx.auto_paste, ctx.logger);

    if (action_ == "save") {
        std::filesystem::path destination = argument_.empty()
            ? std::filesystem::path(QuickActions::suggested_file_name(*item))
            : std::filesystem::path(argument_);
        auto result = actions.save_to_file(*item, destination);
        if (!result.ok()) {
            return report_error(result.error());
        }
        std::cout << "Saved to " << destination.string() << "\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    Result<ClipboardItem> produced = Error(ErrorCode::INVALID_OPERATION, "Unknown action");
    if (action_ == "base64") {
        produced = actions.copy_as_base64(*item);
    } else if (action_ == "url-encode") {
        produced = actions.url_encode(*item);
    } else if (action_ == "url-decode") {
        produced = actions.url_decode(*item);
    } else if (action_ == "edit") {
        if (argument_.empty()) {
            std::cerr << "Error: edit requires the new text\n";
            return CLIPSTASH_EXIT_USER_ERROR;
        }
        produced = actions.edit_text(*item, argument_);
    }

    if (!produced.ok()) {
        return report_error(produced.error());
    }
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
