#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

/**
 * Backup export/import of history and pinned items.
 */
class BackupCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "backup"; }
    std::string description() const override {
        return "Export or import a backup";
    }

private:
    CLI::App* export_cmd_ = nullptr;
    CLI::App* import_cmd_ = nullptr;
    std::string path_;
};

}  // namespace clipstash::cli
