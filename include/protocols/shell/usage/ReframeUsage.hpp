#pragma once

#include "protocols/shell/CommandUsage.hpp"

namespace rf::protocols::shell {

class ReframeUsage {
public:
    [[nodiscard]] static CommandBook all();

    [[nodiscard]] static CommandUsage convert();
    [[nodiscard]] static CommandUsage serve();
    [[nodiscard]] static CommandUsage help();
    [[nodiscard]] static CommandUsage version();

    [[nodiscard]] static std::vector<Entry> globals();
};

}
