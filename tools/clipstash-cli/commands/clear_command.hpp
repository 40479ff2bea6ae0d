#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

class ClearCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "clear"; }
    std::string description() const override {
        return "Clear history (pins are kept)";
    }
};

}  // namespace clipstash::cli
