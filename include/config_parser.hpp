/**
 * @file config_parser.hpp
 * @brief YAML configuration parsing for tproxy-compose
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * This file contains the ConfigParser class responsible for parsing YAML
 * configuration files and converting them to Config objects.
 */

#pragma once

#include "config.hpp"
#include <string>

namespace tproxy {

/**
 * @class ConfigParser
 * @brief YAML configuration parser and serializer
 *
 * Static methods for loading YAML documents into Config objects and saving
 * them back, using the yaml-cpp conversions declared in config.hpp.
 * Loading a valid configuration also applies its log_level to Logger.
 */
class ConfigParser {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param filename Path to the YAML configuration file
     * @return Parsed and validated Configuration object
     * @throws std::runtime_error if the file cannot be read, the YAML is
     *         malformed or the configuration is invalid
     */
    static Config loadFromFile(const std::string& filename);

    /**
     * @brief Load configuration from a YAML string
     * @param yaml_content YAML content as string
     * @return Parsed and validated Configuration object
     * @throws std::runtime_error if the YAML is malformed or the
     *         configuration is invalid
     *
     * An empty document yields the default configuration.
     */
    static Config loadFromString(const std::string& yaml_content);

    /**
     * @brief Save configuration to a YAML file
     * @param config Configuration object to save
     * @param filename Path where to save the YAML file
     * @throws std::runtime_error if file cannot be written
     */
    static void saveToFile(const Config& config, const std::string& filename);

private:
    /**
     * @brief Convert a parsed document and validate the result
     * @throws std::runtime_error if the configuration is invalid
     */
    static Config fromNode(const YAML::Node& node);
};

} // namespace tproxy
