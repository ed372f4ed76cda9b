#pragma once

#include "protocols/shell/types.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "image/model/EncodeConfig.hpp"
#include "image/model/Encoding.hpp"
#include "image/model/ResizeSpec.hpp"

#include <filesystem>

namespace rf::config { struct Config; }

namespace rf::protocols::shell {

class Router;

struct ConvertArgs {
    std::filesystem::path source;
    std::filesystem::path output;
    image::model::ResizeSpec to;
    image::model::Encoding encoding;
};

// Pure argument validation; touches no files.
Lookup<ConvertArgs> parseConvertArgs(const CommandCall& call);

// Encoding implied by an output path: .avif, .jpg or .jpeg, else nullopt.
std::optional<image::model::Encoding> encodingFromExtension(const std::filesystem::path& output);

CommandResult convert(const CommandCall& call, const image::model::EncodeConfig& encoding);

// Blocks until SIGINT or SIGTERM.
CommandResult serve(const config::Config& config);

CommandResult help(const CommandCall& call);
CommandResult version(const CommandCall& call);

void registerAllCommands(Router& router);

}
