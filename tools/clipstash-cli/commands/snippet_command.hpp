#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <map>
#include <string>
#include <vector>

namespace clipstash::cli {

/**
 * Snippet management through nested subcommands: list, add, edit, rm, use.
 */
class SnippetCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "snippet"; }
    std::string description() const override {
        return "Manage text snippets";
    }

private:
    CLI::App* list_cmd_ = nullptr;
    CLI::App* add_cmd_ = nullptr;
    CLI::App* edit_cmd_ = nullptr;
    CLI::App* rm_cmd_ = nullptr;
    CLI::App* use_cmd_ = nullptr;

    std::string ref_;
    std::string title_;
    std::string content_;
    std::string category_;
    std::vector<std::string> values_;

    int list(CommandContext& ctx);
    int add(CommandContext& ctx);
    int edit(CommandContext& ctx);
    int remove(CommandContext& ctx);
    int use(CommandContext& ctx);
};

}  // namespace clipstash::cli
