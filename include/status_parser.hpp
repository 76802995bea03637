/**
 * @file status_parser.hpp
 * @brief Structured parsing of ufw status output
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the StatusParser class, which turns the text printed by
 * "ufw status" and "ufw status numbered" into rule entries so that rule
 * existence can be decided by whole-field comparison instead of substring
 * search.
 */

#pragma once

#include "rule.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ufwctl {

/**
 * @struct StatusEntry
 * @brief One rule row of a ufw status listing
 *
 * For the row "[ 3] 8080/tcp (v6)   ALLOW IN   Anywhere (v6)   # web" the
 * fields are number=3, to="8080/tcp", action="ALLOW", direction="IN",
 * from="Anywhere", v6=true, comment="web".
 */
struct StatusEntry {
    std::optional<int> number;  ///< Rule number, only in numbered listings
    std::string to;             ///< "To" column without the (v6) marker
    std::string action;         ///< ALLOW, DENY, REJECT or LIMIT
    std::string direction;      ///< IN, OUT, FWD, or empty
    std::string from;           ///< "From" column without the (v6) marker
    bool v6 = false;            ///< Row is the IPv6 twin of a rule
    std::string comment;        ///< Rule comment, empty if none
};

/**
 * @class StatusParser
 * @brief Static helpers for interpreting ufw status reports
 */
class StatusParser {
public:
    /**
     * @brief Parse all rule rows of a status report
     * @param report Output of "ufw status" or "ufw status numbered"
     * @return Entries in listing order; header, separator and status lines
     *         are skipped, as are rows that do not have three columns
     */
    static std::vector<StatusEntry> parse(const std::string& report);

    /**
     * @brief Check for the exact "Status: active" line
     * @param report Output of "ufw status"
     * @return true if the firewall reports itself active
     *
     * Unlike a substring search this does not match "Status: inactive".
     */
    static bool isActive(const std::string& report);

    /**
     * @brief Check whether a rule appears among parsed entries
     * @param entries Parsed status rows
     * @param rule Rule to look for
     * @return true if some entry's To and From columns equal the ones the
     *         rule would produce; the action column is not compared
     */
    static bool containsRule(const std::vector<StatusEntry>& entries, const RuleSpec& rule);

    /**
     * @brief Find the first entry matching a rule
     * @param entries Parsed status rows
     * @param rule Rule to look for
     * @return Matching entry, or std::nullopt; same comparison as containsRule()
     */
    static std::optional<StatusEntry> findRule(const std::vector<StatusEntry>& entries,
                                               const RuleSpec& rule);

    /**
     * @brief Format an entry for log output
     * @param entry Parsed status row
     * @return e.g. "[3] 8080/tcp ALLOW IN Anywhere (v6) # web"
     */
    static std::string describe(const StatusEntry& entry);

    /**
     * @brief "To" column ufw prints for a rule
     * @param rule Rule descriptor
     * @return e.g. "80/tcp", "8080", or "Anywhere" for a source rule without port
     */
    static std::string expectedTo(const RuleSpec& rule);

    /**
     * @brief "From" column ufw prints for a rule
     * @param rule Rule descriptor
     * @return Source address, or "Anywhere" for port rules
     */
    static std::string expectedFrom(const RuleSpec& rule);

private:
    static std::optional<StatusEntry> parseLine(const std::string& line);
    static std::vector<std::string> splitColumns(const std::string& text);
};

} // namespace ufwctl
