#include "backup_command.hpp"

namespace clipstash::cli {

void BackupCommand::setup(CLI::App& app) {
    app.require_subcommand(1);

    export_cmd_ = app.add_subcommand("export", "Write history and pins to a file");
    export_cmd_->add_option("file", path_, "Destination file")->required();

    import_cmd_ = app.add_subcommand("import", "Replace history and pins from a file");
    import_cmd_->add_option("file", path_, "Backup file")->required();
}

int BackupCommand::execute(CommandContext& ctx) {
    BackupService backup(*ctx.store, ctx.logger);

    if (export_cmd_->parsed()) {
        auto result = backup.export_to_file(path_);
        if (!result.ok()) {
            return report_error(result.error());
        }
        std::cout << "Exported " << ctx.store->history()->size() << " item(s) and "
                  << ctx.store->pinned()->size() << " pin(s) to " << path_ << "\n";
        return CLIPSTASH_EXIT_SUCCESS;
    }

    auto result = backup.import_from_file(path_);
    if (!result.ok()) {
        return report_error(result.error());
    }
    std::cout << "Imported " << ctx.store->history()->size() << " item(s) and "
              << ctx.store->pinned()->size() << " pin(s)\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
