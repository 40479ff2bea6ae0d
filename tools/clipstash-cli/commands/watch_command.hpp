#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

/**
 * Run the capture runtime with stdin as the clipboard source.
 */
class WatchCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "watch"; }
    std::string description() const override {
        return "Capture each stdin line until end of input";
    }
};

}  // namespace clipstash::cli
