#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace rf::config {

namespace {

Config decode(const YAML::Node& root) {
    Config cfg;

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["server"]; node && !YAML::convert<ServerConfig>::decode(node, cfg.server))
        throw std::runtime_error("Config section 'server' must be a mapping");
    if (auto node = root["encoding"]; node && !YAML::convert<image::model::EncodeConfig>::decode(node, cfg.encoding))
        throw std::runtime_error("Config section 'encoding' must be a mapping");
    if (auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw std::runtime_error("Config section 'logging' must be a mapping");

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file does not exist: " + path.string());

    try {
        return decode(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

void Config::validate() const {
    encoding.validate();

    if (server.concurrency_limit == 0)
        throw std::invalid_argument("server.concurrency_limit must be at least 1");
    if (server.io_threads == 0)
        throw std::invalid_argument("server.io_threads must be at least 1");
    if (server.port == 0)
        throw std::invalid_argument("server.port must be non-zero");
}

}
