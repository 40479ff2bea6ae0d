#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

class RmCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "rm"; }
    std::string description() const override {
        return "Delete a history item";
    }

private:
    std::string ref_;
};

}  // namespace clipstash::cli
