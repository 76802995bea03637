#include "operation_result.hpp"
#include <yaml-cpp/yaml.h>

namespace ufwctl {

std::string OperationResult::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "status" << YAML::Value << statusString();
    if (rule_) {
        out << YAML::Key << "rule" << YAML::Value << *rule_;
    }
    out << YAML::Key << "action" << YAML::Value << action_;
    out << YAML::Key << "message" << YAML::Value << message_;
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace ufwctl
