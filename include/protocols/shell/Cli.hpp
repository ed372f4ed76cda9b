#pragma once

#include "protocols/shell/types.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

#include <string>
#include <vector>

namespace rf::config { struct Config; }

namespace rf::protocols::shell {

class Cli {
public:
    // Whole process lifetime for one invocation: config, logging, then the command.
    static CommandResult run(const std::vector<std::string>& args);

    // Defaults, then the YAML file, then global and serve flags. A bad flag value is
    // reported through Lookup::error; an unreadable or malformed file throws.
    static Lookup<config::Config> resolveConfig(const CommandCall& call);
};

}
