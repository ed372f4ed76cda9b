#include "protocols/shell/Router.hpp"
#include "protocols/shell/CommandUsage.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <cctype>

using namespace rf::protocols::shell;
using rf::log::Registry;

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = normalize(usage.primary());

    CommandInfo info{usage.description.empty() ? "No description provided." : usage.description, std::move(handler), {}};

    for (const auto& alias : usage.aliases) {
        const auto a = normalize(strip_leading_dashes(alias));
        if (a == key) continue;
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                    a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(strip_leading_dashes(nameOrAlias));
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::knows(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::executeArgs(const std::vector<std::string>& args) const {
    const auto tokens = tokenize(args);
    Registry::shell()->debug("[Router] Tokens: {}", to_string(tokens));
    return execute(parseTokens(tokens));
}

CommandResult Router::execute(CommandCall call) const {
    // "--help" / "--version" arrive as switches, not as a command word
    if (call.name.empty()) {
        if (hasKey(call, "help") || hasKey(call, "h")) call.name = "help";
        else if (hasKey(call, "version") || hasKey(call, "v")) call.name = "version";
        else return usage();
    }

    const auto canonical = canonicalFor(call.name);

    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, usage().stdout_text));

    if (canonical != "help" && (hasKey(call, "help") || hasKey(call, "h"))) return usage(canonical);

    Registry::shell()->debug("[Router] Executing command: '{}'", canonical);
    return commands_.at(canonical).handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::strip_leading_dashes(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}
