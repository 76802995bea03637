#include "command_dispatcher.hpp"
#include "rule.hpp"
#include <optional>
#include <stdexcept>

namespace ufwctl {

namespace {

std::string argOrEmpty(const std::vector<std::string>& args, size_t index) {
    return index < args.size() ? args[index] : std::string();
}

Action verbToAction(const std::string& verb) {
    if (verb == "allow") return Action::Allow;
    if (verb == "deny") return Action::Deny;
    if (verb == "reject") return Action::Reject;
    throw std::invalid_argument("Unknown verb: " + verb);
}

} // namespace

int CommandDispatcher::dispatch(RuleManager& manager, const CLIParser::Options& options, std::ostream& out) {
    const std::string& command = options.command;
    const auto& args = options.args;

    if (command == "status") {
        out << manager.status() << '\n';
        return 0;
    }
    if (command == "list") {
        out << manager.listRules() << '\n';
        return 0;
    }
    if (command == "enabled") {
        bool enabled = manager.isEnabled();
        out << (enabled ? "yes" : "no") << '\n';
        return enabled ? 0 : 1;
    }

    std::optional<OperationResult> result;

    if (command == "enable") {
        result = manager.enable();
    } else if (command == "disable") {
        result = manager.disable();
    } else if (command == "reload") {
        result = manager.reload();
    } else if (command == "reset") {
        result = manager.reset();
    } else if (command == "logging") {
        result = manager.logging();
    } else if (command == "allow" || command == "deny" || command == "reject") {
        Protocol protocol = protocolFromString(argOrEmpty(args, 1));
        result = manager.addRule(RuleSpec::port(args.at(0), protocol, verbToAction(command)));
    } else if (command == "allow-from" || command == "deny-from" || command == "reject-from") {
        std::string verb = command.substr(0, command.find('-'));
        Protocol protocol = protocolFromString(argOrEmpty(args, 2));
        result = manager.addRule(
            RuleSpec::fromIp(args.at(0), argOrEmpty(args, 1), protocol, verbToAction(verb)));
    } else if (command == "backup") {
        result = manager.backup(args.at(0));
    } else if (command == "restore") {
        result = manager.restore(args.at(0));
    } else {
        throw std::invalid_argument("Unknown command: " + command);
    }

    out << result->toYaml() << '\n';
    return 0;
}

} // namespace ufwctl
