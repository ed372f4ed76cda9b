#pragma once

#include "image/model/EncodeConfig.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace rf::config {

constexpr static auto DEFAULT_CONFIG_PATH = "/etc/reframe/config.yaml";

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    std::filesystem::path images_dir = "images";
    unsigned int concurrency_limit = 50;
    unsigned int workers = 0;       // 0 = hardware_concurrency
    unsigned int io_threads = 1;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum reframe  = spdlog::level::info;   // startup, shutdown, fatal errors
    spdlog::level::level_enum pipeline = spdlog::level::info;   // stage timings at debug
    spdlog::level::level_enum gate     = spdlog::level::warn;
    spdlog::level::level_enum http     = spdlog::level::info;
    spdlog::level::level_enum shell    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    image::model::EncodeConfig encoding;
    LoggingConfig logging;

    // Throws std::invalid_argument on values the service cannot run with.
    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

}
