#include "add_command.hpp"

namespace clipstash::cli {

void AddCommand::setup(CLI::App& app) {
    app.add_option("text", text_, "Text to capture")
        ->type_name("<text>");

    app.add_flag("--stdin", from_stdin_, "Read text from stdin");

    app.add_option("--file", file_, "Capture a file reference")
        ->type_name("<path>");

    app.add_option("--image", image_, "Capture the bytes of an image file")
        ->type_name("<path>");

    app.add_option("-t,--type", type_, "Item type (classified automatically if omitted)")
        ->type_name("<type>");

    app.add_option("-s,--source", source_app_, "Source application id")
        ->type_name("<app>");
}

int AddCommand::execute(CommandContext& ctx) {
    ItemSource source;
    if (!source_app_.empty()) {
        source.app_id = source_app_;
    }

    if (!image_.empty()) {
        auto bytes = read_file(image_);
        if (!bytes.has_value()) {
            std::cerr << "Error: Could not read file: " << image_ << "\n";
            return CLIPSTASH_EXIT_IO_ERROR;
        }
        return capture(ctx, ClipboardItem::make_image(std::move(*bytes), source));
    }

    if (!file_.empty()) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(file_, ec);
        return capture(ctx, ClipboardItem::make_file(ec ? file_ : absolute.string(), source));
    }

    std::string text;
    if (from_stdin_) {
        text = read_stdin();
    } else if (!text_.empty()) {
        text = text_;
    } else {
        std::cerr << "Error: Nothing to add\n";
        std::cerr << "Usage: clipstash add <text> | --stdin | --file <path> | --image <path>\n";
        return CLIPSTASH_EXIT_USER_ERROR;
    }

    ItemType type = ItemClassifier::classify(text);
    if (!type_.empty()) {
        auto parsed = parse_item_type(type_);
        if (!parsed.has_value() || !is_text_family(*parsed)) {
            std::cerr << "Error: Unknown text type: " << type_ << "\n";
            return CLIPSTASH_EXIT_USER_ERROR;
        }
        type = *parsed;
    }

    return capture(ctx, ClipboardItem::make_text(std::move(text), type, source));
}

int AddCommand::capture(CommandContext& ctx, ClipboardItem item) {
    auto before = ctx.store->generation();
    std::string type_name = item_type_name(item.type());

    auto result = ctx.store->add_item(std::move(item));
    if (!result.ok()) {
        return report_error(result.error());
    }

    if (ctx.store->generation() == before) {
        std::cout << "Not recorded (history is off, incognito, or source excluded).\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    auto history = ctx.store->history();
    if (!history->empty()) {
        std::cout << "Captured " << type_name << " " << short_id(history->front().id()) << "\n";
    }
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
