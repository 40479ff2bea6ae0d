#include "watch_command.hpp"

namespace clipstash::cli {

void WatchCommand::setup(CLI::App& /* app */) {
    // No options for watch command
}

int WatchCommand::execute(CommandContext& ctx) {
    auto started = ctx.store->start_runtime();
    if (!started.ok()) {
        return report_error(started.error());
    }
    if (ctx.verbose) {
        std::cerr << "Watching stdin; end input to stop.\n";
    }

    ctx.monitor->wait_until_closed();

    auto stopped = ctx.store->stop_runtime();
    if (!stopped.ok()) {
        return report_error(stopped.error());
    }
    auto flushed = ctx.store->flush();
    if (!flushed.ok()) {
        return report_error(flushed.error());
    }

    std::cout << "Captured " << ctx.monitor->captured_count() << " item(s)\n";
    return CLIPSTASH_EXIT_SUCCESS;
}

}  // namespace clipstash::cli
