#include "protocols/shell/Cli.hpp"

#include <fmt/core.h>
#include <string>
#include <vector>

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    const auto res = rf::protocols::shell::Cli::run(args);

    if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
    if (!res.stderr_text.empty()) fmt::print(stderr, "{}", res.stderr_text);
    return res.exit_code;
}
