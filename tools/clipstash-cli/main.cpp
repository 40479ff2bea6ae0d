#include "commands/action_command.hpp"
#include "commands/add_command.hpp"
#include "commands/backup_command.hpp"
#include "commands/clear_command.hpp"
#include "commands/command.hpp"
#include "commands/copy_command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/list_command.hpp"
#include "commands/pin_command.hpp"
#include "commands/rm_command.hpp"
#include "commands/settings_command.hpp"
#include "commands/snippet_command.hpp"
#include "commands/watch_command.hpp"
#include "platform/stdio_clipboard.hpp"

#include <clipstash/clipstash.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace clipstash;
using namespace clipstash::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"clipstash - clipboard history manager"};
    app.require_subcommand(1);

    std::string store_dir;
    std::string log_file;
    bool verbose = false;
    size_t max_image_bytes = limits::MAX_PERSISTED_IMAGE_BYTES;

    app.add_option("--store", store_dir, "Store directory (default: $CLIPSTASH_HOME or ~/.clipstash)")
        ->type_name("<dir>");
    app.add_option("--log-file", log_file, "Append log lines to this file")
        ->type_name("<path>");
    app.add_option("--max-image-bytes", max_image_bytes, "Largest image kept in history")
        ->type_name("<bytes>");
    app.add_flag("-v,--verbose", verbose, "Verbose logging");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ListCommand>());
    commands.push_back(std::make_unique<AddCommand>());
    commands.push_back(std::make_unique<RmCommand>());
    commands.push_back(std::make_unique<ClearCommand>());
    commands.push_back(std::make_unique<CopyCommand>());
    commands.push_back(std::make_unique<PinCommand>());
    commands.push_back(std::make_unique<SettingsCommand>());
    commands.push_back(std::make_unique<SnippetCommand>());
    commands.push_back(std::make_unique<BackupCommand>());
    commands.push_back(std::make_unique<ActionCommand>());
    commands.push_back(std::make_unique<WatchCommand>());

    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        registered.emplace_back(sub, command.get());
    }

    CLI11_PARSE(app, argc, argv);

    auto logger = std::make_shared<ConsoleLogger>();
    logger->set_min_level(verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    auto monitor = std::make_shared<StdinClipboardMonitor>(0, logger);
    auto auto_paste = std::make_shared<StdoutAutoPasteService>(std::cout);

    Config config;
    config.root_directory = store_dir.empty() ? get_default_store_path()
                                              : std::filesystem::path(store_dir);
    config.verbose = verbose;
    config.log_file = log_file;
    config.max_persisted_image_bytes = max_image_bytes;

    auto opened = ClipboardStore::open(config, monitor, auto_paste);
    if (!opened.ok()) {
        return report_error(opened.error());
    }
    std::unique_ptr<ClipboardStore> store = std::move(opened).value();

    CommandContext ctx;
    ctx.store = store.get();
    ctx.verbose = verbose;
    ctx.store_path = config.root_directory;
    ctx.monitor = monitor;
    ctx.auto_paste = auto_paste;
    ctx.logger = logger;

    int exit_code = CLIPSTASH_EXIT_USER_ERROR;
    for (auto& [sub, command] : registered) {
        if (sub->parsed()) {
            exit_code = command->execute(ctx);
            break;
        }
    }

    auto flushed = store->flush();
    if (!flushed.ok()) {
        int code = report_error(flushed.error());
        if (exit_code == CLIPSTASH_EXIT_SUCCESS) {
            exit_code = code;
        }
    }
    return exit_code;
}
