#pragma once

#include "config/Config.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rf::config;
using rf::image::model::EncodeConfig;
using rf::image::model::FilterType;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum parseLevel(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["images_dir"] = rhs.images_dir;
        node["concurrency_limit"] = rhs.concurrency_limit;
        node["workers"] = rhs.workers;
        node["io_threads"] = rhs.io_threads;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(3000);
        rhs.images_dir = node["images_dir"].as<std::filesystem::path>(std::filesystem::path("images"));
        rhs.concurrency_limit = node["concurrency_limit"].as<unsigned int>(50);
        rhs.workers = node["workers"].as<unsigned int>(0);
        rhs.io_threads = node["io_threads"].as<unsigned int>(1);
        return true;
    }
};

template<>
struct convert<EncodeConfig> {
    static Node encode(const EncodeConfig& rhs) {
        Node node;
        node["quality"] = rhs.quality;
        node["speed"] = rhs.speed;
        node["filter"] = std::string(rf::image::model::to_string(rhs.filter));
        return node;
    }

    static bool decode(const Node& node, EncodeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.quality = node["quality"].as<float>(90.0f);
        rhs.speed = node["speed"].as<int>(4);
        if (const auto filter = node["filter"]) {
            const auto name = filter.as<std::string>();
            const auto parsed = rf::image::model::parseFilter(name);
            if (!parsed) throw std::invalid_argument("Unknown resize filter in config: " + name);
            rhs.filter = *parsed;
        }
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["reframe"]  = to_std_string(spdlog::level::to_string_view(rhs.reframe));
        node["pipeline"] = to_std_string(spdlog::level::to_string_view(rhs.pipeline));
        node["gate"]     = to_std_string(spdlog::level::to_string_view(rhs.gate));
        node["http"]     = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.reframe  = parseLevel(node["reframe"], spdlog::level::info);
        rhs.pipeline = parseLevel(node["pipeline"], spdlog::level::info);
        rhs.gate     = parseLevel(node["gate"], spdlog::level::warn);
        rhs.http     = parseLevel(node["http"], spdlog::level::info);
        rhs.shell    = parseLevel(node["shell"], spdlog::level::info);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLevel(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = parseLevel(node["file_log_level"], spdlog::level::warn);
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::filesystem::path>(std::filesystem::path());
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
