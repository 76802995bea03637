#include "status_parser.hpp"
#include <regex>
#include <sstream>

namespace ufwctl {

namespace {

const std::string kAnywhere = "Anywhere";
const std::string kV6Marker = " (v6)";

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

// Removes a trailing " (v6)" marker, returns whether one was present
bool stripV6(std::string& field) {
    if (field.size() >= kV6Marker.size() &&
        field.compare(field.size() - kV6Marker.size(), kV6Marker.size(), kV6Marker) == 0) {
        field.erase(field.size() - kV6Marker.size());
        return true;
    }
    return false;
}

} // namespace

std::vector<StatusEntry> StatusParser::parse(const std::string& report) {
    std::vector<StatusEntry> entries;

    // Rows are independent; anything that is not a rule row is dropped by parseLine
    std::istringstream stream(report);
    std::string line;
    while (std::getline(stream, line)) {
        auto entry = parseLine(line);
        if (entry) {
            entries.push_back(*entry);
        }
    }

    return entries;
}

bool StatusParser::isActive(const std::string& report) {
    std::istringstream stream(report);
    std::string line;
    while (std::getline(stream, line)) {
        if (trim(line) == "Status: active") {
            return true;
        }
    }
    return false;
}

bool StatusParser::containsRule(const std::vector<StatusEntry>& entries, const RuleSpec& rule) {
    return findRule(entries, rule).has_value();
}

std::optional<StatusEntry> StatusParser::findRule(const std::vector<StatusEntry>& entries,
                                                  const RuleSpec& rule) {
    const std::string to = expectedTo(rule);
    const std::string from = expectedFrom(rule);

    // Whole-field comparison; the IPv6 twin of a rule matches the same way
    for (const auto& entry : entries) {
        if (entry.to == to && entry.from == from) {
            return entry;
        }
    }
    return std::nullopt;
}

std::string StatusParser::describe(const StatusEntry& entry) {
    std::string text;
    if (entry.number) {
        text = "[" + std::to_string(*entry.number) + "] ";
    }

    text += entry.to + " " + entry.action;
    if (!entry.direction.empty()) {
        text += " " + entry.direction;
    }
    text += " " + entry.from;
    if (entry.v6) {
        text += kV6Marker;
    }
    if (!entry.comment.empty()) {
        text += " # " + entry.comment;
    }
    return text;
}

std::string StatusParser::expectedTo(const RuleSpec& rule) {
    std::string proto = protocolToString(rule.protocol());

    if (rule.kind() == RuleSpec::Kind::Port) {
        return rule.render();
    }

    std::string to = rule.destinationPort().value_or(kAnywhere);
    if (!proto.empty()) {
        to += "/" + proto;
    }
    return to;
}

std::string StatusParser::expectedFrom(const RuleSpec& rule) {
    if (rule.kind() == RuleSpec::Kind::Port) {
        return kAnywhere;
    }
    return rule.target();
}

std::optional<StatusEntry> StatusParser::parseLine(const std::string& line) {
    static const std::regex numbered_regex(R"(^\s*\[\s*(\d+)\]\s*(.*)$)");

    StatusEntry entry;
    std::string body = line;

    // "status numbered" prefixes each row with "[ N]"; plain "status" does not
    std::smatch match;
    if (std::regex_match(line, match, numbered_regex)) {
        entry.number = std::stoi(match[1].str());
        body = match[2].str();
    }

    // To, Action and From are mandatory; "Status: active" and blank lines
    // never have three columns
    auto columns = splitColumns(body);
    if (columns.size() < 3) {
        return std::nullopt;
    }

    // Column header and its underline
    if (columns[0] == "To" && columns[2] == "From") {
        return std::nullopt;
    }
    if (columns[0].compare(0, 2, "--") == 0) {
        return std::nullopt;
    }

    // Both columns carry the (v6) marker on IPv6 rows; keep the plain
    // address so IPv4 and IPv6 twins compare equal
    entry.to = columns[0];
    entry.from = columns[2];
    bool to_v6 = stripV6(entry.to);
    bool from_v6 = stripV6(entry.from);
    entry.v6 = to_v6 || from_v6;

    // "ALLOW IN" in verbose listings, "ALLOW" alone for simple rules
    std::istringstream action_stream(columns[1]);
    action_stream >> entry.action >> entry.direction;

    // Comments appear after the From column as "# text"
    for (size_t i = 3; i < columns.size(); ++i) {
        if (columns[i][0] == '#') {
            entry.comment = trim(columns[i].substr(1));
            break;
        }
    }

    return entry;
}

std::vector<std::string> StatusParser::splitColumns(const std::string& text) {
    // ufw pads columns with at least two spaces; single spaces occur inside
    // fields such as "ALLOW IN" or "Anywhere (v6)"
    std::vector<std::string> columns;
    std::string trimmed = trim(text);

    size_t pos = 0;
    while (pos < trimmed.size()) {
        size_t gap = trimmed.find("  ", pos);
        if (gap == std::string::npos) {
            columns.push_back(trimmed.substr(pos));
            break;
        }
        columns.push_back(trimmed.substr(pos, gap - pos));
        pos = trimmed.find_first_not_of(' ', gap);
    }

    return columns;
}

} // namespace ufwctl
