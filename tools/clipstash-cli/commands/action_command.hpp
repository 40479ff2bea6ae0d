#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

/**
 * Quick actions on a single item:
 *   action <ref> base64 | url-encode | url-decode
 *   action <ref> save [path]
 *   action <ref> edit <text>
 */
class ActionCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "action"; }
    std::string description() const override {
        return "Run a quick action on an item";
    }

private:
    std::string ref_;
    std::string action_;
    std::string argument_;
};

}  // namespace clipstash::cli
