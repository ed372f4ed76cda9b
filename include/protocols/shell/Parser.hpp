#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace rf::protocols::shell {

// Flags that never take a value, wherever they appear.
inline const std::unordered_set<std::string>& switchFlags() {
    static const std::unordered_set<std::string> flags{"help", "h", "version", "v"};
    return flags;
}

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Flags may appear before or after the command name and take the following Word as their
// value. The first Word not consumed by a flag names the command.
inline CommandCall parseTokens(const std::vector<Token>& toks) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto& key = t.text;
            if (!switchFlags().contains(key) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word
                && toks[i + 1].text != "--") {
                setOpt(call, key, toks[i + 1].text);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty() && !stop_flags) {
            call.name = t.text;
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
