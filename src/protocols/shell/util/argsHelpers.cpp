#include "protocols/shell/util/argsHelpers.hpp"
#include "protocols/shell/usage/ReframeUsage.hpp"

#include <algorithm>

namespace rf::protocols::shell {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg) + "\n"}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult failed(std::string msg) { return {1, "", std::move(msg) + "\n"}; }

CommandResult invalid(const std::string& command, std::string msg) {
    const auto book = ReframeUsage::all();
    const auto* cmd = book.find(command);
    if (!cmd) return invalid(std::move(msg));

    auto u = *cmd;
    u.theme.enabled = false;
    return {2, "", std::move(msg) + "\n\n" + u.basicStr()};
}

CommandResult usage(const std::string& command) {
    auto book = ReframeUsage::all();
    book.book_theme = ColorTheme{.enabled = false};
    if (command.empty()) return ok(book.basicStr());
    if (const auto* cmd = book.find(command)) {
        auto u = *cmd;
        u.theme = *book.book_theme;
        return ok(u.str());
    }
    return invalid("Unknown command: " + command);
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

bool hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

}
