#include "rule.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <utility>

namespace ufwctl {

std::string actionToString(Action action) {
    switch (action) {
        case Action::Allow:
            return "allow";
        case Action::Deny:
            return "deny";
        case Action::Reject:
            return "reject";
        default:
            throw std::runtime_error("Unknown action");
    }
}

std::string protocolToString(Protocol protocol) {
    switch (protocol) {
        case Protocol::Any:
            return "";
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
        default:
            throw std::runtime_error("Unknown protocol");
    }
}

Protocol protocolFromString(const std::string& name) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value.empty() || value == "any" || value == "both") {
        return Protocol::Any;
    } else if (value == "tcp") {
        return Protocol::Tcp;
    } else if (value == "udp") {
        return Protocol::Udp;
    }

    throw std::invalid_argument("Unknown protocol: " + name + " (expected tcp or udp)");
}

namespace {

// Port number, port range or service name; '/' is reserved for the protocol suffix
const std::regex target_pattern("^[A-Za-z0-9][A-Za-z0-9_.:,-]*$");

// IPv4 or IPv6 address with optional prefix length, or "any"
const std::regex address_pattern("^(any|[0-9A-Fa-f.:]+(/[0-9]{1,3})?)$");

// Port number or range such as "6000:6007" or "80,443"
const std::regex port_pattern("^[0-9]+([:,][0-9]+)*$");

}

RuleSpec::RuleSpec(Kind kind, std::string target, std::optional<std::string> port,
                   Protocol protocol, Action action)
    : kind_(kind)
    , target_(std::move(target))
    , port_(std::move(port))
    , protocol_(protocol)
    , action_(action) {}

RuleSpec RuleSpec::port(const std::string& target, Protocol protocol, Action action) {
    if (target.empty()) {
        throw std::invalid_argument("Port or service must not be empty");
    }
    if (!std::regex_match(target, target_pattern)) {
        throw std::invalid_argument("Invalid port or service: '" + target + "'");
    }
    return RuleSpec(Kind::Port, target, std::nullopt, protocol, action);
}

RuleSpec RuleSpec::fromIp(const std::string& ip, const std::string& port,
                          Protocol protocol, Action action) {
    if (ip.empty()) {
        throw std::invalid_argument("Source address must not be empty");
    }
    if (!std::regex_match(ip, address_pattern)) {
        throw std::invalid_argument("Invalid source address: '" + ip + "'");
    }
    if (!port.empty() && !std::regex_match(port, port_pattern)) {
        throw std::invalid_argument("Invalid port: '" + port + "'");
    }
    std::optional<std::string> dest_port;
    if (!port.empty()) {
        dest_port = port;
    }
    return RuleSpec(Kind::FromIp, ip, dest_port, protocol, action);
}

std::string RuleSpec::render() const {
    if (kind_ == Kind::Port) {
        if (protocol_ == Protocol::Any) {
            return target_;
        }
        return target_ + "/" + protocolToString(protocol_);
    }

    // Parts are appended in a fixed order regardless of which are present
    std::string rule = "from " + target_;
    if (port_) {
        rule += " to any port " + *port_;
    }
    if (protocol_ != Protocol::Any) {
        rule += " proto " + protocolToString(protocol_);
    }
    return rule;
}

} // namespace ufwctl
