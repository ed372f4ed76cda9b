#pragma once

#include "protocols/shell/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rf::protocols::shell {

template <typename T> struct Lookup {
    std::shared_ptr<T> ptr;
    std::string error;
    explicit operator bool() const { return static_cast<bool>(ptr); }
};

CommandResult invalid(std::string msg);
CommandResult invalid(const std::string& command, std::string msg);
CommandResult ok(std::string out);
CommandResult failed(std::string msg);
CommandResult usage(const std::string& command = {});

// Value of the first matching key. A flag given without a value yields "".
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

}
