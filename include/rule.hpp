/**
 * @file rule.hpp
 * @brief Rule descriptors and common enumerations for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the RuleSpec descriptor and the enumerations used to
 * build it. A RuleSpec renders to the canonical rule string that is both
 * passed to ufw and searched for in its status output.
 */

#pragma once

#include <string>
#include <optional>

namespace ufwctl {

/**
 * @enum Action
 * @brief ufw verbs that add a rule
 */
enum class Action {
    Allow,  ///< "allow" - accept matching traffic
    Deny,   ///< "deny" - silently drop matching traffic
    Reject  ///< "reject" - drop with rejection notice
};

/**
 * @enum Protocol
 * @brief Transport protocol of a rule
 *
 * Any means the protocol is left unspecified, which ufw applies to both
 * TCP and UDP.
 */
enum class Protocol {
    Any, ///< Unspecified, both protocols
    Tcp, ///< TCP protocol
    Udp  ///< UDP protocol
};

/**
 * @brief Convert action to its ufw verb
 * @param action Action to convert
 * @return "allow", "deny" or "reject"
 */
std::string actionToString(Action action);

/**
 * @brief Convert protocol to its ufw name
 * @param protocol Protocol to convert
 * @return "tcp", "udp", or an empty string for Any
 */
std::string protocolToString(Protocol protocol);

/**
 * @brief Parse a protocol name
 * @param name "tcp", "udp", or "", "any", "both" for Any (case-insensitive)
 * @return Matching Protocol
 * @throws std::invalid_argument for any other value
 */
Protocol protocolFromString(const std::string& name);

/**
 * @class RuleSpec
 * @brief Descriptor of a single ufw rule
 *
 * Two shapes are supported:
 * - Port rules: a port number or service name with an optional protocol,
 *   rendered "80" or "80/tcp".
 * - Source rules: a source address with optional port and protocol,
 *   rendered "from IP[ to any port PORT][ proto PROTO]".
 *
 * The factories reject targets that contain whitespace, shell syntax or
 * rule keywords, so distinct inputs render distinct strings and render()
 * doubles as the identity used for existence checks.
 */
class RuleSpec {
public:
    enum class Kind {
        Port,   ///< Port or service rule
        FromIp  ///< Source address rule
    };

    /**
     * @brief Build a port or service rule
     * @param target Port number or service name (e.g. "80", "ssh")
     * @param protocol Optional protocol restriction
     * @param action Verb used when the rule is added
     * @throws std::invalid_argument if target is empty or is not a port,
     *         port range or service name
     */
    static RuleSpec port(const std::string& target,
                         Protocol protocol = Protocol::Any,
                         Action action = Action::Allow);

    /**
     * @brief Build a source address rule
     * @param ip Source address or network
     * @param port Optional destination port; empty for any port
     * @param protocol Optional protocol restriction
     * @param action Verb used when the rule is added
     * @throws std::invalid_argument if ip is not an address, network or
     *         "any", or if port is not numeric
     */
    static RuleSpec fromIp(const std::string& ip,
                           const std::string& port = "",
                           Protocol protocol = Protocol::Any,
                           Action action = Action::Allow);

    /**
     * @brief Render the canonical rule string
     * @return Rule text as passed to "ufw <verb> <rule>"
     */
    std::string render() const;

    Kind kind() const { return kind_; }
    const std::string& target() const { return target_; }
    const std::optional<std::string>& destinationPort() const { return port_; }
    Protocol protocol() const { return protocol_; }
    Action action() const { return action_; }

private:
    RuleSpec(Kind kind, std::string target, std::optional<std::string> port,
             Protocol protocol, Action action);

    Kind kind_;
    std::string target_;                ///< Port/service, or source address
    std::optional<std::string> port_;   ///< Destination port of source rules
    Protocol protocol_;
    Action action_;
};

} // namespace ufwctl
