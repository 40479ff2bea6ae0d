#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

/**
 * Select an item: it becomes active and its content is written to the
 * clipboard (stdout for this tool).
 */
class CopyCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "copy"; }
    std::string description() const override {
        return "Copy an item back to the clipboard";
    }

private:
    std::string ref_;
    bool paste_ = false;
};

}  // namespace clipstash::cli
