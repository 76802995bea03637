#include "config_parser.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace ufwctl {

ControllerConfig ConfigParser::loadFromFile(const std::string& filename) {
    try {
        return fromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        // Syntax errors, bad enum values and unreadable files all land here
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

ControllerConfig ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        return fromNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

void ConfigParser::saveToFile(const ControllerConfig& config, const std::string& filename) {
    YAML::Node yamlNode = YAML::convert<ControllerConfig>::encode(config);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file for writing: " + filename);
    }
    file << yamlNode << '\n';
    if (!file) {
        throw std::runtime_error("Configuration saving error: failed to write " + filename);
    }
}

ControllerConfig ConfigParser::fromNode(const YAML::Node& node) {
    ControllerConfig config;
    if (node.IsNull()) {
        return config;
    }

    config = node.as<ControllerConfig>();
    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }
    return config;
}

} // namespace ufwctl
