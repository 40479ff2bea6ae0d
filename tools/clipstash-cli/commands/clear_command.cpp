#include "clear_command.hpp"

namespace clipstash::cli {

void ClearCommand::setup(CLI::App& /* app */) {
    // No options for clear command
}

int ClearCommand::execute(CommandContext& ctx) {
    size_t count = ctx.store->history()->size();

    auto result = ctx.store->clear_history();
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Cleared " << count << " item(s)\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
