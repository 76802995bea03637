/**
 * @file config_parser.hpp
 * @brief YAML configuration parsing for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the ConfigParser class responsible for parsing YAML
 * configuration files into ControllerConfig objects.
 */

#pragma once

#include "config.hpp"
#include <string>

namespace ufwctl {

/**
 * @class ConfigParser
 * @brief YAML configuration parser and serializer
 */
class ConfigParser {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param filename Path to the YAML configuration file
     * @return Parsed and validated configuration
     * @throws std::runtime_error if the file cannot be read, is not valid
     *         YAML, or holds an invalid configuration
     */
    static ControllerConfig loadFromFile(const std::string& filename);

    /**
     * @brief Load configuration from a YAML string
     * @param yaml_content YAML content as string
     * @return Parsed and validated configuration
     * @throws std::runtime_error if YAML or configuration is invalid
     */
    static ControllerConfig loadFromString(const std::string& yaml_content);

    /**
     * @brief Save configuration to a YAML file
     * @param config Configuration to save
     * @param filename Destination path
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveToFile(const ControllerConfig& config, const std::string& filename);

private:
    static ControllerConfig fromNode(const YAML::Node& node);
};

} // namespace ufwctl
