#include "protocols/shell/commands.hpp"

#include <fmt/core.h>

#ifndef REFRAME_VERSION
#define REFRAME_VERSION "0.0.0"
#endif

namespace rf::protocols::shell {

CommandResult help(const CommandCall& call) {
    if (call.positionals.empty()) return usage();
    return usage(call.positionals.front());
}

CommandResult version(const CommandCall&) {
    return ok(fmt::format("reframe {}\n", REFRAME_VERSION));
}

}
