#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>

namespace clipstash::cli {

/**
 * Pin management.
 *
 *   pin <ref> [-t title]     Pin an item
 *   pin --remove <ref>       Unpin by item or pin id
 *   pin --toggle <ref>       Flip the pinned state
 *   pin --rename <pin> -t    Set or clear (blank title) the custom title
 */
class PinCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "pin"; }
    std::string description() const override {
        return "Pin, unpin or rename a pinned item";
    }

private:
    std::string ref_;
    std::string title_;
    bool remove_ = false;
    bool toggle_ = false;
    bool rename_ = false;
};

}  // namespace clipstash::cli
