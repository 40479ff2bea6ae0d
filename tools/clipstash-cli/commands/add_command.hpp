#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <string>
#include <vector>

namespace clipstash::cli {

/**
 * Capture content into history as if it came from the clipboard.
 *
 * Input modes (mutually exclusive):
 * - Positional text
 * - --stdin: Read text from stdin
 * - --file: Capture a file reference
 * - --image: Capture the bytes of an image file
 */
class AddCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "add"; }
    std::string description() const override {
        return "Capture content into history";
    }

private:
    std::string text_;
    std::string file_;
    std::string image_;
    std::string type_;
    std::string source_app_;
    bool from_stdin_ = false;

    int capture(CommandContext& ctx, ClipboardItem item);
};

}  // namespace clipstash::cli
