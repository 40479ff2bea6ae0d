#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

/**
 * List history (most recent first), pinned items, or both.
 */
class ListCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "list"; }
    std::string description() const override {
        return "List clipboard history";
    }

private:
    bool pinned_ = false;
    bool all_ = false;
    size_t limit_ = 0;
};

}  // namespace clipstash::cli
