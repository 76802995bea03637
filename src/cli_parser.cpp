#include "cli_parser.hpp"
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>
#include <getopt.h>

namespace ufwctl {

namespace {

// Command name -> (minimum, maximum) argument count
const std::map<std::string, std::pair<size_t, size_t>>& commandArity() {
    static const std::map<std::string, std::pair<size_t, size_t>> arity = {
        {"status",      {0, 0}},
        {"list",        {0, 0}},
        {"enabled",     {0, 0}},
        {"enable",      {0, 0}},
        {"disable",     {0, 0}},
        {"reload",      {0, 0}},
        {"reset",       {0, 0}},
        {"logging",     {0, 0}},
        {"allow",       {1, 2}},
        {"deny",        {1, 2}},
        {"reject",      {1, 2}},
        {"allow-from",  {1, 3}},
        {"deny-from",   {1, 3}},
        {"reject-from", {1, 3}},
        {"backup",      {1, 1}},
        {"restore",     {1, 1}},
    };
    return arity;
}

} // namespace

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    // Long option table; short forms are listed in the getopt string below
    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},
        {"verbose", no_argument,       0, 'v'},
        {"quiet",   no_argument,       0, 'q'},
        {"debug",   no_argument,       0, 'd'},
        {"info",    no_argument,       0, 'i'},
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // Full getopt reinitialization, parse() may run more than once per process
    optind = 0;

    int option_index = 0;
    int c;

    // Leading '+' stops at the command name so its arguments are left alone
    while ((c = getopt_long(argc, argv, "+c:vqdih", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                options.config_file = std::filesystem::path(optarg);
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'd':
                options.debug = true;
                break;
            case 'i':
                options.show_info = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long has already printed the reason
                throw std::invalid_argument("Unknown option");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    // First non-option word is the command, everything after it belongs to it
    if (optind < argc) {
        options.command = argv[optind];
        for (int i = optind + 1; i < argc; ++i) {
            options.args.emplace_back(argv[i]);
        }
    }

    validateOptions(options);

    return options;
}

bool CLIParser::isKnownCommand(const std::string& command) {
    return commandArity().count(command) > 0;
}

void CLIParser::validateOptions(const Options& options) {
    // Logging flags select a single level
    if (options.verbose && options.quiet) {
        throw std::invalid_argument("--verbose conflicts with --quiet");
    }

    // Help and info may be requested without a command
    if (options.help || options.show_info) {
        return;
    }

    if (options.command.empty()) {
        throw std::invalid_argument("No action specified");
    }

    if (!isKnownCommand(options.command)) {
        throw std::invalid_argument("Unknown command: " + options.command);
    }

    // Argument count only; values such as protocols and addresses are
    // checked when the rule is built
    const auto& limits = commandArity().at(options.command);
    if (options.args.size() < limits.first) {
        throw std::invalid_argument("Missing argument for '" + options.command + "'");
    }
    if (options.args.size() > limits.second) {
        throw std::invalid_argument("Too many arguments for '" + options.command + "'");
    }
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS...]\n\n";
    std::cout << "Manage ufw firewall rules without adding duplicates\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE  YAML configuration file\n";
    std::cout << "  -v, --verbose      Debug logging\n";
    std::cout << "  -q, --quiet        Log errors only\n";
    std::cout << "  -d, --debug        Debug mode (bypass system validation)\n";
    std::cout << "  -i, --info         Print system information\n";
    std::cout << "  -h, --help         Show this help message\n\n";
    std::cout << "Commands:\n";
    std::cout << "  status                           Print 'ufw status'\n";
    std::cout << "  list                             Print numbered rules\n";
    std::cout << "  enabled                          Print yes/no, exit 0 if active\n";
    std::cout << "  enable | disable | reload        Change firewall state\n";
    std::cout << "  reset                            Delete all rules\n";
    std::cout << "  logging                          Turn logging on\n";
    std::cout << "  allow|deny|reject TARGET [PROTO] Add a port or service rule\n";
    std::cout << "  allow-from|deny-from|reject-from IP [PORT [PROTO]]\n";
    std::cout << "                                   Add a source address rule\n";
    std::cout << "  backup PATH                      Save 'ufw status' to PATH\n";
    std::cout << "  restore PATH                     Reset, then replay PATH line by line\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " allow 80 tcp\n";
    std::cout << "  " << program_name << " deny-from 10.0.0.5 22 tcp\n";
    std::cout << "  " << program_name << " -c /etc/ufwctl.yaml restore backup.rules\n";
}

} // namespace ufwctl
