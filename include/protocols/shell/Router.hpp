#pragma once

#include "protocols/shell/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace rf::protocols::shell {

class CommandUsage;

class Router {
public:
    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    CommandResult execute(CommandCall call) const;

    CommandResult executeArgs(const std::vector<std::string>& args) const;

    [[nodiscard]] bool knows(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string strip_leading_dashes(const std::string& s);
};

}
