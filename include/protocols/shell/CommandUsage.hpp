#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rf::protocols::shell {

// A simple labeled entry (option/flag), with optional aliases.
struct Entry {
    std::string label;                  // primary, e.g. "--width <W>"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-w"}
};

// Example: {"reframe convert in.jpg --width 800 out.avif", "Resize to 800px wide"}
struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = true;

    std::string header = "\033[1;36m"; // section titles (bold cyan)
    std::string command = "\033[1;32m"; // command name (bold green)
    std::string key = "\033[33m";      // left column keys (yellow)
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class CommandUsage {
public:
    std::string command;                         // e.g. "convert"
    std::vector<std::string> aliases;            // e.g. {"c"}
    std::string description;
    std::optional<std::string> synopsis;         // if empty, synthesized

    std::vector<Entry> positionals;              // ordered; appear in synopsis
    std::vector<Entry> required;
    std::vector<Entry> optional;

    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;
    bool show_aliases = true;
    ColorTheme theme{};

    [[nodiscard]] std::string primary() const { return command; }

    // Full help: header, synopsis, option sections, examples.
    [[nodiscard]] std::string str() const;

    // Header and synopsis only.
    [[nodiscard]] std::string basicStr(bool splitHeader = false) const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string normalizePositional_(const std::string& s);
    [[nodiscard]] static std::string bracketizeIfNeeded_(const std::string& s, bool square);
    [[nodiscard]] static std::string joinAliasesInline_(const std::string& primary,
                                                        const std::vector<std::string>& aliases,
                                                        const std::string& sep);
};

class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;
    std::vector<Entry> globals;                  // flags accepted by every command

    // If set, overrides each command's theme
    std::optional<ColorTheme> book_theme;

    // Command summaries followed by the global options.
    [[nodiscard]] std::string basicStr() const;

    // nullptr when no command or alias matches
    [[nodiscard]] const CommandUsage* find(const std::string& nameOrAlias) const;
};

}
