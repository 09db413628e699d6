#include "config_parser.hpp"
#include "logger.hpp"
#include <fstream>
#include <stdexcept>

namespace tproxy {

Config ConfigParser::loadFromFile(const std::string& filename) {
    try {
        // YAML::LoadFile throws YAML::BadFile when the file cannot be opened
        return fromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Configuration loading error: " + std::string(e.what()));
    }
}

Config ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        return fromNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Configuration loading error: " + std::string(e.what()));
    }
}

void ConfigParser::saveToFile(const Config& config, const std::string& filename) {
    try {
        YAML::Node yamlNode = YAML::convert<Config>::encode(config);

        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Unable to open file for writing: " + filename);
        }
        file << yamlNode << '\n';
        if (!file) {
            throw std::runtime_error("Failed to write configuration to: " + filename);
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Configuration saving error: " + std::string(e.what()));
    }
}

Config ConfigParser::fromNode(const YAML::Node& node) {
    Config config;
    if (node.IsDefined() && !node.IsNull()) {
        config = node.as<Config>();
    }

    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }

    // The configured log level takes effect as soon as the configuration is loaded
    Logger::setLevel(config.log_level);
    return config;
}

} // namespace tproxy
