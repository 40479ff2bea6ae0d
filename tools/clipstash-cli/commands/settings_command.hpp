#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>
#include <vector>

namespace clipstash::cli {

/**
 * Show settings, or apply key=value assignments in one validated update.
 */
class SettingsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "settings"; }
    std::string description() const override {
        return "Show or change settings";
    }

private:
    std::vector<std::string> assignments_;
    std::vector<std::string> exclude_;
    std::vector<std::string> include_;
};

}  // namespace clipstash::cli
