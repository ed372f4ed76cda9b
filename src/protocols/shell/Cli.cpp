#include "protocols/shell/Cli.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/commands.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/core.h>

using namespace rf;
using namespace rf::protocols::shell;
using namespace rf::config;

namespace {

std::string applyEncodingFlags(const CommandCall& call, image::model::EncodeConfig& enc) {
    using image::model::EncodeConfig;

    if (const auto v = optVal(call, "quality")) {
        const auto q = util::parseDouble(*v);
        if (!q || *q < EncodeConfig::MIN_QUALITY || *q > EncodeConfig::MAX_QUALITY)
            return fmt::format("--quality must be a number in [1, 100], got '{}'", *v);
        enc.quality = static_cast<float>(*q);
    }

    if (const auto v = optVal(call, "speed")) {
        const auto s = util::parseUInt(*v);
        if (!s || *s < EncodeConfig::MIN_SPEED || *s > EncodeConfig::MAX_SPEED)
            return fmt::format("--speed must be an integer in [1, 10], got '{}'", *v);
        enc.speed = static_cast<int>(*s);
    }

    if (const auto v = optVal(call, "filter")) {
        const auto f = image::model::parseFilter(*v);
        if (!f) return fmt::format("Unknown --filter '{}'", *v);
        enc.filter = *f;
    }

    return {};
}

std::string applyLogFlags(const CommandCall& call, LoggingConfig& logging) {
    const auto v = optVal(call, "log-level");
    if (!v) return {};

    const auto level = spdlog::level::from_str(*v);
    if (level == spdlog::level::off && *v != "off")
        return fmt::format("Unknown --log-level '{}'", *v);

    auto& levels = logging.levels;
    levels.console_log_level = level;

    // Loggers filter before sinks, so lower them too or the console never sees the extra detail.
    auto& sub = levels.subsystem_levels;
    for (auto* l : {&sub.reframe, &sub.pipeline, &sub.gate, &sub.http, &sub.shell})
        *l = std::min(*l, level);

    return {};
}

std::string applyServeFlags(const CommandCall& call, ServerConfig& server) {
    if (const auto v = optVal(call, "addr")) {
        try {
            const auto ep = protocols::parseEndpoint(*v, server.port);
            server.host = ep.address().to_string();
            server.port = ep.port();
        } catch (const std::invalid_argument& e) {
            return e.what();
        }
    }

    if (const auto v = optVal(call, "images")) {
        if (v->empty()) return "--images expects a directory";
        server.images_dir = *v;
    }

    if (const auto v = optVal(call, "concurrency")) {
        const auto n = util::parseUInt(*v);
        if (!n || *n == 0) return fmt::format("--concurrency must be a positive integer, got '{}'", *v);
        server.concurrency_limit = *n;
    }

    if (const auto v = optVal(call, "workers")) {
        const auto n = util::parseUInt(*v);
        if (!n) return fmt::format("--workers must be an unsigned integer, got '{}'", *v);
        server.workers = *n;
    }

    return {};
}

}

Lookup<Config> Cli::resolveConfig(const CommandCall& call) {
    Lookup<Config> out;

    Config cfg;
    if (const auto path = optVal(call, "config")) {
        if (path->empty()) {
            out.error = "--config expects a path";
            return out;
        }
        cfg = loadConfig(*path);
    } else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
        cfg = loadConfig(DEFAULT_CONFIG_PATH);
    }

    for (const auto& err : {applyEncodingFlags(call, cfg.encoding),
                            applyLogFlags(call, cfg.logging),
                            applyServeFlags(call, cfg.server)}) {
        if (!err.empty()) {
            out.error = err;
            return out;
        }
    }

    out.ptr = std::make_shared<Config>(std::move(cfg));
    return out;
}

CommandResult Cli::run(const std::vector<std::string>& args) {
    const auto call = parseTokens(tokenize(args));

    Lookup<Config> cfg;
    try {
        cfg = resolveConfig(call);
    } catch (const std::exception& e) {
        return failed(fmt::format("Failed to load configuration: {}", e.what()));
    }
    if (!cfg) return invalid(cfg.error);

    try {
        ConfigRegistry::init(*cfg.ptr);
        log::Registry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        return failed(fmt::format("Invalid configuration: {}", e.what()));
    }

    Router router;
    registerAllCommands(router);
    return router.execute(call);
}
