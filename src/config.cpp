#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ufwctl {

bool ControllerConfig::isValid() const {
    if (tool.empty()) {
        return false;
    }
    // The tool name is spliced into shell command lines unquoted
    return std::none_of(tool.begin(), tool.end(), [](unsigned char c) {
        return std::isspace(c) || c == ';' || c == '&' || c == '|' || c == '`' || c == '$';
    });
}

std::string ControllerConfig::getErrorMessage() const {
    if (tool.empty()) {
        return "'tool' must not be empty";
    }
    if (!isValid()) {
        return "'tool' contains whitespace or shell metacharacters: " + tool;
    }
    return "";
}

std::string existenceCheckToString(ExistenceCheck mode) {
    switch (mode) {
        case ExistenceCheck::Substring:
            return "substring";
        case ExistenceCheck::Structured:
            return "structured";
        default:
            throw std::runtime_error("Unknown existence check mode");
    }
}

std::string restoreOrderToString(RestoreOrder order) {
    switch (order) {
        case RestoreOrder::ResetFirst:
            return "reset-first";
        case RestoreOrder::ValidateFirst:
            return "validate-first";
        default:
            throw std::runtime_error("Unknown restore order");
    }
}

} // namespace ufwctl

namespace YAML {

using namespace ufwctl;

Node convert<ExistenceCheck>::encode(const ExistenceCheck& mode) {
    return Node(existenceCheckToString(mode));
}

bool convert<ExistenceCheck>::decode(const Node& node, ExistenceCheck& mode) {
    if (!node.IsScalar()) return false;

    std::string value = node.as<std::string>();
    if (value == "substring") {
        mode = ExistenceCheck::Substring;
    } else if (value == "structured") {
        mode = ExistenceCheck::Structured;
    } else {
        return false;
    }
    return true;
}

Node convert<RestoreOrder>::encode(const RestoreOrder& order) {
    return Node(restoreOrderToString(order));
}

bool convert<RestoreOrder>::decode(const Node& node, RestoreOrder& order) {
    if (!node.IsScalar()) return false;

    std::string value = node.as<std::string>();
    if (value == "reset-first") {
        order = RestoreOrder::ResetFirst;
    } else if (value == "validate-first") {
        order = RestoreOrder::ValidateFirst;
    } else {
        return false;
    }
    return true;
}

Node convert<LogLevel>::encode(const LogLevel& level) {
    return Node(Logger::levelToString(level));
}

bool convert<LogLevel>::decode(const Node& node, LogLevel& level) {
    if (!node.IsScalar()) return false;

    try {
        level = Logger::levelFromString(node.as<std::string>());
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

Node convert<ControllerConfig>::encode(const ControllerConfig& config) {
    Node node;
    node["tool"] = config.tool;
    node["privilege_command"] = config.privilege_command;
    node["assume_yes"] = config.assume_yes;
    node["existence_check"] = config.existence_check;
    node["restore_order"] = config.restore_order;
    node["log_level"] = config.log_level;
    return node;
}

bool convert<ControllerConfig>::decode(const Node& node, ControllerConfig& config) {
    // An empty document is a valid, all-default configuration
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    if (node["tool"]) {
        config.tool = node["tool"].as<std::string>();
    }
    if (node["privilege_command"]) {
        config.privilege_command = node["privilege_command"].IsNull()
            ? std::string()
            : node["privilege_command"].as<std::string>();
    }
    if (node["assume_yes"]) {
        config.assume_yes = node["assume_yes"].as<bool>();
    }
    if (node["existence_check"]) {
        config.existence_check = node["existence_check"].as<ExistenceCheck>();
    }
    if (node["restore_order"]) {
        config.restore_order = node["restore_order"].as<RestoreOrder>();
    }
    if (node["log_level"]) {
        config.log_level = node["log_level"].as<LogLevel>();
    }
    return true;
}

} // namespace YAML
