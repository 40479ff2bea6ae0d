#include "snippet_command.hpp"

#include <iomanip>

namespace clipstash::cli {

void SnippetCommand::setup(CLI::App& app) {
    app.require_subcommand(1);

    list_cmd_ = app.add_subcommand("list", "List snippets");

    add_cmd_ = app.add_subcommand("add", "Create a snippet");
    add_cmd_->add_option("title", title_, "Snippet title")->required();
    add_cmd_->add_option("content", content_, "Content with {placeholder} fields")->required();
    add_cmd_->add_option("-c,--category", category_, "Category")->type_name("<name>");

    edit_cmd_ = app.add_subcommand("edit", "Change a snippet");
    edit_cmd_->add_option("snippet", ref_, "Snippet id, prefix or title")->required();
    edit_cmd_->add_option("--title", title_, "New title")->type_name("<title>");
    edit_cmd_->add_option("--content", content_, "New content")->type_name("<text>");
    edit_cmd_->add_option("-c,--category", category_, "New category")->type_name("<name>");

    rm_cmd_ = app.add_subcommand("rm", "Delete a snippet");
    rm_cmd_->add_option("snippet", ref_, "Snippet id, prefix or title")->required();

    use_cmd_ = app.add_subcommand("use", "Resolve a snippet and copy the result");
    use_cmd_->add_option("snippet", ref_, "Snippet id, prefix or title")->required();
    use_cmd_->add_option("-v,--value", values_, "Placeholder value as name=value (repeatable)")
        ->type_name("<name=value>");
}

int SnippetCommand::execute(CommandContext& ctx) {
    if (list_cmd_->parsed()) return list(ctx);
    if (add_cmd_->parsed()) return add(ctx);
    if (edit_cmd_->parsed()) return edit(ctx);
    if (rm_cmd_->parsed()) return remove(ctx);
    if (use_cmd_->parsed()) return use(ctx);

    std::cerr << "Error: Missing snippet subcommand\n";
    return CLIPSTASH_EXIT_USER_ERROR;
}

int SnippetCommand::list(CommandContext& ctx) {
    auto snippets = ctx.store->snippets();
    if (snippets->empty()) {
        std::cout << "No snippets found.\n";
        std::cout << "Use 'clipstash snippet add' to create your first snippet.\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    std::cout << std::left
              << std::setw(10) << "ID"
              << std::setw(25) << "TITLE"
              << std::setw(15) << "CATEGORY"
              << "PLACEHOLDERS\n";
    std::cout << std::string(80, '-') << "\n";

    for (const auto& s : *snippets) {
        std::string fields;
        for (const auto& p : s.placeholders()) {
            if (!fields.empty()) fields += ", ";
            fields += p;
        }
        std::cout << std::left
                  << std::setw(10) << short_id(s.id)
                  << std::setw(25) << truncate(s.title, 24)
                  << std::setw(15) << truncate(s.category, 14)
                  << truncate(fields, 30) << "\n";
    }

    std::cout << "\n" << snippets->size() << " snippet(s)";
    if (!ctx.store->settings().snippets_enabled) {
        std::cout << " [disabled]";
    }
    std::cout << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

int SnippetCommand::add(CommandContext& ctx) {
    auto result = ctx.store->add_snippet(title_, content_, category_);
    if (!result.ok()) {
        return report_error(result.error());
    }
    std::cout << "Added snippet " << short_id(result->id) << ": " << result->title << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

int SnippetCommand::edit(CommandContext& ctx) {
    auto snippet = resolve_snippet(*ctx.store, ref_);
    if (!snippet.ok()) {
        return report_error(snippet.error());
    }

    Snippet updated = snippet.value();
    if (!title_.empty()) updated.title = title_;
    if (!content_.empty()) updated.content = content_;
    if (edit_cmd_->count("--category") > 0) updated.category = category_;

    auto result = ctx.store->update_snippet(updated);
    if (!result.ok()) {
        return report_error(result.error());
    }
    std::cout << "Updated snippet " << short_id(updated.id) << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

int SnippetCommand::remove(CommandContext& ctx) {
    auto snippet = resolve_snippet(*ctx.store, ref_);
    if (!snippet.ok()) {
        return report_error(snippet.error());
    }

    auto result = ctx.store->delete_snippet(snippet->id);
    if (!result.ok()) {
        return report_error(result.error());
    }
    std::cout << "Deleted snippet " << short_id(snippet->id) << "\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

int SnippetCommand::use(CommandContext& ctx) {
    auto snippet = resolve_snippet(*ctx.store, ref_);
    if (!snippet.ok()) {
        return report_error(snippet.error());
    }

    std::map<std::string, std::string> values;
    for (const auto& v : values_) {
        auto eq = v.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: Expected name=value, got '" << v << "'\n";
            return CLIPSTASH_EXIT_USER_ERROR;
        }
        values[v.substr(0, eq)] = v.substr(eq + 1);
    }

    auto resolved = ctx.store->use_snippet(snippet->id, values);
    if (!resolved.ok()) {
        return report_error(resolved.error());
    }

    // Resolved text is delivered like any clipboard write
    auto written = ctx.auto_paste->set_clipboard_content(ClipboardItem::make_text(*resolved));
    if (!written.ok()) {
        return report_error(written.error());
    }
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
