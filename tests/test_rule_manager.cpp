#include "rule_manager.hpp"
#include "errors.hpp"
#include "scripted_executor.hpp"
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <string>
#include <vector>
#include <unistd.h>

using namespace ufwctl;
using ufwctl::testing::ScriptedExecutor;

namespace {

const std::string activeStatus =
	"Status: active\n"
	"\n"
	"To                         Action      From\n"
	"--                         ------      ----\n"
	"22/tcp                     ALLOW       Anywhere\n"
	"8080/tcp                   ALLOW       10.0.0.5\n";

const std::string activeNumbered =
	"Status: active\n"
	"\n"
	"     To                         Action      From\n"
	"     --                         ------      ----\n"
	"[ 1] 22/tcp                     ALLOW IN    Anywhere\n"
	"[ 2] 8080/tcp                   ALLOW IN    10.0.0.5\n";

// Writes a file under the temp directory and removes it on destruction
class TempRulesFile {
public:
	explicit TempRulesFile(const std::string& content) {
		static std::atomic<int> counter{0};
		path_ = std::filesystem::temp_directory_path() /
			("ufwctl_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".rules");
		std::ofstream out(path_);
		out << content;
	}
	~TempRulesFile() {
		std::error_code ec;
		std::filesystem::remove(path_, ec);
	}
	std::string path() const { return path_.string(); }

private:
	std::filesystem::path path_;
};

// Minimal ufw stand-in whose status reflects the rules added so far
class FirewallState : public Executor {
public:
	CommandResult execute(const std::string& command) override {
		std::lock_guard<std::mutex> lock(mutex_);
		CommandResult result;
		result.command = command;
		result.success = true;
		result.exit_code = 0;

		const std::string allow = "sudo ufw allow ";
		if (command == "sudo ufw status") {
			result.stdout_output = "Status: active\n" + rules_;
		} else if (command.compare(0, allow.size(), allow) == 0) {
			rules_ += command.substr(allow.size()) + "    ALLOW    Anywhere\n";
			++mutations;
			result.stdout_output = "Rule added";
		}
		return result;
	}

	int mutations = 0;

private:
	std::mutex mutex_;
	std::string rules_;
};

std::string missingPath() {
	return (std::filesystem::temp_directory_path() / "ufwctl_test_does_not_exist.rules").string();
}

}

BOOST_AUTO_TEST_SUITE(rule_manager)

BOOST_AUTO_TEST_CASE(existingRuleIsSkipped) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	RuleManager manager(executor);

	auto result = manager.allow("22", Protocol::Tcp);

	BOOST_CHECK(result.status() == OperationResult::Status::Skipped);
	BOOST_CHECK_EQUAL("skipped", result.statusString());
	BOOST_CHECK_EQUAL("allow", result.action());
	BOOST_CHECK_EQUAL("22/tcp", *result.rule());
	BOOST_CHECK_EQUAL("Rule '22/tcp' already exists.", result.message());

	BOOST_REQUIRE_EQUAL(1u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw status", executor.commands[0]);
}

BOOST_AUTO_TEST_CASE(existingRuleIsSkippedForEveryVerb) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	RuleManager manager(executor);

	BOOST_CHECK_EQUAL("skipped", manager.deny("22", Protocol::Tcp).statusString());
	BOOST_CHECK_EQUAL("skipped", manager.reject("22", Protocol::Tcp).statusString());

	for (const auto& command : executor.commands) {
		BOOST_CHECK_EQUAL("sudo ufw status", command);
	}
}

BOOST_AUTO_TEST_CASE(absentRuleIssuesOneCommand) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	executor.respond("sudo ufw allow 80/tcp", "Rule added\nRule added (v6)\n");
	RuleManager manager(executor);

	auto result = manager.allow("80", Protocol::Tcp);

	BOOST_CHECK(result.status() == OperationResult::Status::Success);
	BOOST_CHECK_EQUAL("allow", result.action());
	BOOST_CHECK_EQUAL("80/tcp", *result.rule());
	BOOST_CHECK_EQUAL("Rule added\nRule added (v6)", result.message());

	BOOST_REQUIRE_EQUAL(2u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw status", executor.commands[0]);
	BOOST_CHECK_EQUAL("sudo ufw allow 80/tcp", executor.commands[1]);
}

BOOST_AUTO_TEST_CASE(verbsUseCanonicalRendering) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", "Status: active\n");
	RuleManager manager(executor);

	manager.deny("443");
	manager.reject("53", Protocol::Udp);
	manager.allowFromIp("10.0.0.7", "8080", Protocol::Tcp);
	manager.denyFromIp("10.0.0.8");
	manager.rejectFromIp("10.0.0.9", "25");

	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw deny 443"));
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw reject 53/udp"));
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw allow from 10.0.0.7 to any port 8080 proto tcp"));
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw deny from 10.0.0.8"));
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw reject from 10.0.0.9 to any port 25"));
	BOOST_CHECK_EQUAL(5u, executor.count("sudo ufw status"));
}

BOOST_AUTO_TEST_CASE(malformedTargetIssuesNoCommand) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	RuleManager manager(executor);

	BOOST_CHECK_THROW(manager.allow("80; touch /tmp/ufwctl"), std::invalid_argument);
	BOOST_CHECK_THROW(manager.deny("80/tcp", Protocol::Udp), std::invalid_argument);
	BOOST_CHECK_THROW(manager.allowFromIp("10.0.0.5 to any port 22"), std::invalid_argument);
	BOOST_CHECK(executor.commands.empty());
}

BOOST_AUTO_TEST_CASE(substringCheckMatchesInsideLargerRule) {
	// "80" is found inside "8080/tcp"; inherited behavior of substring mode
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	RuleManager manager(executor);

	BOOST_CHECK(manager.ruleExists(RuleSpec::port("80")));
	BOOST_CHECK_EQUAL("skipped", manager.allow("80").statusString());
	BOOST_CHECK_EQUAL(0u, executor.count("sudo ufw allow 80"));
}

BOOST_AUTO_TEST_CASE(substringCheckMissesSourceRules) {
	// ufw prints source rules as columns, never as "from ..." text
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	RuleManager manager(executor);

	auto result = manager.allowFromIp("10.0.0.5", "8080", Protocol::Tcp);
	BOOST_CHECK_EQUAL("success", result.statusString());
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw allow from 10.0.0.5 to any port 8080 proto tcp"));
}

BOOST_AUTO_TEST_CASE(structuredCheckComparesColumns) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status numbered", activeNumbered);
	ControllerConfig config;
	config.existence_check = ExistenceCheck::Structured;
	RuleManager manager(executor, config);

	BOOST_CHECK(!manager.ruleExists(RuleSpec::port("80")));
	BOOST_CHECK(manager.ruleExists(RuleSpec::port("22", Protocol::Tcp)));

	BOOST_CHECK_EQUAL("success", manager.allow("80").statusString());
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw allow 80"));

	BOOST_CHECK_EQUAL("skipped",
		manager.allowFromIp("10.0.0.5", "8080", Protocol::Tcp).statusString());
	BOOST_CHECK_EQUAL(0u, executor.count("sudo ufw status"));
}

BOOST_AUTO_TEST_CASE(concurrentCallersAddRuleOnce) {
	FirewallState firewall;
	RuleManager manager(firewall);

	std::vector<std::thread> workers;
	for (int i = 0; i < 8; ++i) {
		workers.emplace_back([&manager]() { manager.allow("8443", Protocol::Tcp); });
	}
	for (auto& worker : workers) {
		worker.join();
	}

	BOOST_CHECK_EQUAL(1, firewall.mutations);
}

BOOST_AUTO_TEST_CASE(statusFailurePropagates) {
	ScriptedExecutor executor;
	executor.fail("sudo ufw status", "ERROR: You need to be root to run this script");
	RuleManager manager(executor);

	try {
		manager.allow("80");
		BOOST_FAIL("expected ExecutionFailure");
	} catch (const ExecutionFailure& e) {
		BOOST_CHECK_EQUAL("ERROR: You need to be root to run this script", e.stderrText());
		BOOST_CHECK_EQUAL("sudo ufw status", e.command());
		BOOST_CHECK_EQUAL(1, e.exitCode());
	}
	BOOST_CHECK_EQUAL(1u, executor.commands.size());
}

BOOST_AUTO_TEST_CASE(mutationFailurePropagates) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", "Status: active\n");
	executor.fail("sudo ufw allow bogus", "ERROR: Could not find a profile matching 'bogus'");
	RuleManager manager(executor);

	BOOST_CHECK_EXCEPTION(manager.allow("bogus"), ExecutionFailure,
		[](const ExecutionFailure& e) {
			return e.stderrText() == "ERROR: Could not find a profile matching 'bogus'";
		});
}

BOOST_AUTO_TEST_CASE(queriesReturnRawText) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw status", activeStatus);
	executor.respond("sudo ufw status numbered", activeNumbered);
	RuleManager manager(executor);

	// Only surrounding whitespace is trimmed
	BOOST_CHECK_EQUAL(activeStatus.substr(0, activeStatus.size() - 1), manager.status());
	BOOST_CHECK_EQUAL(activeNumbered.substr(0, activeNumbered.size() - 1), manager.listRules());
}

BOOST_AUTO_TEST_CASE(isEnabledSubstring) {
	ScriptedExecutor executor;
	RuleManager manager(executor);

	executor.respond("sudo ufw status", "Status: active");
	BOOST_CHECK(manager.isEnabled());

	executor.respond("sudo ufw status", "Status: disabled");
	BOOST_CHECK(!manager.isEnabled());

	// "inactive" contains "active"
	executor.respond("sudo ufw status", "Status: inactive");
	BOOST_CHECK(manager.isEnabled());
}

BOOST_AUTO_TEST_CASE(isEnabledStructured) {
	ScriptedExecutor executor;
	ControllerConfig config;
	config.existence_check = ExistenceCheck::Structured;
	RuleManager manager(executor, config);

	executor.respond("sudo ufw status", "Status: active");
	BOOST_CHECK(manager.isEnabled());

	executor.respond("sudo ufw status", "Status: inactive");
	BOOST_CHECK(!manager.isEnabled());
}

BOOST_AUTO_TEST_CASE(lifecycleCommands) {
	ScriptedExecutor executor;
	executor.respond("sudo ufw enable", "Firewall is active and enabled on system startup\n");
	RuleManager manager(executor);

	auto enabled = manager.enable();
	BOOST_CHECK_EQUAL("success", enabled.statusString());
	BOOST_CHECK_EQUAL("enable", enabled.action());
	BOOST_CHECK(!enabled.rule());
	BOOST_CHECK_EQUAL("Firewall is active and enabled on system startup", enabled.message());

	BOOST_CHECK_EQUAL("disable", manager.disable().action());
	BOOST_CHECK_EQUAL("reload", manager.reload().action());
	BOOST_CHECK_EQUAL("reset", manager.reset().action());
	BOOST_CHECK_EQUAL("logging", manager.logging().action());

	std::vector<std::string> expected = {
		"sudo ufw enable",
		"sudo ufw disable",
		"sudo ufw reload",
		"sudo ufw reset",
		"sudo ufw logging on",
	};
	BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(),
		executor.commands.begin(), executor.commands.end());
}

BOOST_AUTO_TEST_CASE(lifecycleFailurePropagates) {
	ScriptedExecutor executor;
	executor.fail("sudo ufw reload", "Firewall not enabled (skipping reload)");
	RuleManager manager(executor);

	BOOST_CHECK_THROW(manager.reload(), ExecutionFailure);
}

BOOST_AUTO_TEST_CASE(assumeYesForcesPrompts) {
	ScriptedExecutor executor;
	ControllerConfig config;
	config.assume_yes = true;
	RuleManager manager(executor, config);

	manager.enable();
	manager.reset();
	manager.disable();

	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw --force enable"));
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw --force reset"));
	BOOST_CHECK_EQUAL(1u, executor.count("sudo ufw disable"));
}

BOOST_AUTO_TEST_CASE(commandPrefixFollowsConfig) {
	ScriptedExecutor executor;
	ControllerConfig config;
	config.privilege_command = "";
	config.tool = "/usr/sbin/ufw";
	RuleManager manager(executor, config);

	BOOST_CHECK_EQUAL("/usr/sbin/ufw status", manager.buildCommand("status"));

	config.privilege_command = "doas";
	config.tool = "ufw";
	RuleManager doas(executor, config);
	BOOST_CHECK_EQUAL("doas ufw allow 22", doas.buildCommand("allow 22"));
}

BOOST_AUTO_TEST_CASE(invalidConfigRejected) {
	ScriptedExecutor executor;
	ControllerConfig config;
	auto construct = [&]() { RuleManager manager(executor, config); };

	config.tool = "";
	BOOST_CHECK_THROW(construct(), std::invalid_argument);

	config.tool = "ufw; rm -rf /";
	BOOST_CHECK_THROW(construct(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(backupRedirectsStatus) {
	ScriptedExecutor executor;
	RuleManager manager(executor);

	auto result = manager.backup("x.rules");

	BOOST_REQUIRE_EQUAL(1u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw status > x.rules", executor.commands[0]);
	BOOST_CHECK_EQUAL("success", result.statusString());
	BOOST_CHECK_EQUAL("backup", result.action());
	BOOST_CHECK_EQUAL("Backup saved to x.rules.", result.message());
}

BOOST_AUTO_TEST_CASE(backupQuotesPath) {
	ScriptedExecutor executor;
	RuleManager manager(executor);

	manager.backup("my rules.txt");
	BOOST_CHECK_EQUAL("sudo ufw status > 'my rules.txt'", executor.commands.at(0));

	BOOST_CHECK_THROW(manager.backup(""), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(backupFailurePropagates) {
	ScriptedExecutor executor;
	executor.fail("sudo ufw status > /nonexistent/x.rules", "sh: 1: cannot create /nonexistent/x.rules: Directory nonexistent", 2);
	RuleManager manager(executor);

	BOOST_CHECK_THROW(manager.backup("/nonexistent/x.rules"), ExecutionFailure);
}

BOOST_AUTO_TEST_CASE(restoreReplaysTrimmedLines) {
	TempRulesFile file("allow 80/tcp\n\n  deny 22  \nreject 443\n");
	ScriptedExecutor executor;
	RuleManager manager(executor);

	auto result = manager.restore(file.path());

	std::vector<std::string> expected = {
		"sudo ufw reset && sudo ufw allow from any",
		"sudo ufw allow 80/tcp",
		"sudo ufw deny 22",
		"sudo ufw reject 443",
	};
	BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(),
		executor.commands.begin(), executor.commands.end());

	BOOST_CHECK_EQUAL("success", result.statusString());
	BOOST_CHECK_EQUAL("restore", result.action());
	BOOST_CHECK_EQUAL("Restored from " + file.path() + ".", result.message());
}

BOOST_AUTO_TEST_CASE(restoreHandlesCrlfAndWhitespaceLines) {
	TempRulesFile file("allow 80/tcp\r\n \t \r\ndeny 22");
	ScriptedExecutor executor;
	RuleManager manager(executor);

	manager.restore(file.path());

	BOOST_REQUIRE_EQUAL(3u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw allow 80/tcp", executor.commands[1]);
	BOOST_CHECK_EQUAL("sudo ufw deny 22", executor.commands[2]);
}

BOOST_AUTO_TEST_CASE(restoreStopsAtFirstFailure) {
	TempRulesFile file("allow 80/tcp\ndeny bogus\nreject 443\n");
	ScriptedExecutor executor;
	executor.fail("sudo ufw deny bogus", "ERROR: Could not find a profile matching 'bogus'");
	RuleManager manager(executor);

	BOOST_CHECK_EXCEPTION(manager.restore(file.path()), ExecutionFailure,
		[](const ExecutionFailure& e) {
			return e.stderrText() == "ERROR: Could not find a profile matching 'bogus'";
		});

	BOOST_REQUIRE_EQUAL(3u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw deny bogus", executor.commands.back());
	BOOST_CHECK_EQUAL(0u, executor.count("sudo ufw reject 443"));
}

BOOST_AUTO_TEST_CASE(restorePrimingFailureStopsEverything) {
	TempRulesFile file("allow 80/tcp\n");
	ScriptedExecutor executor;
	executor.fail("sudo ufw reset && sudo ufw allow from any", "sudo: a password is required");
	RuleManager manager(executor);

	BOOST_CHECK_THROW(manager.restore(file.path()), ExecutionFailure);
	BOOST_CHECK_EQUAL(1u, executor.commands.size());
}

BOOST_AUTO_TEST_CASE(restoreResetFirstPrimesBeforeReading) {
	ScriptedExecutor executor;
	RuleManager manager(executor);

	BOOST_CHECK_THROW(manager.restore(missingPath()), ReadFailure);

	// The destructive pair has already run
	BOOST_REQUIRE_EQUAL(1u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw reset && sudo ufw allow from any", executor.commands[0]);
}

BOOST_AUTO_TEST_CASE(restoreValidateFirstReadsBeforePriming) {
	ScriptedExecutor executor;
	ControllerConfig config;
	config.restore_order = RestoreOrder::ValidateFirst;
	RuleManager manager(executor, config);

	BOOST_CHECK_EXCEPTION(manager.restore(missingPath()), ReadFailure,
		[](const ReadFailure& e) { return e.path() == missingPath(); });
	BOOST_CHECK(executor.commands.empty());

	TempRulesFile file("allow 80/tcp\n");
	manager.restore(file.path());
	BOOST_REQUIRE_EQUAL(2u, executor.commands.size());
	BOOST_CHECK_EQUAL("sudo ufw reset && sudo ufw allow from any", executor.commands[0]);
	BOOST_CHECK_EQUAL("sudo ufw allow 80/tcp", executor.commands[1]);
}

BOOST_AUTO_TEST_CASE(restoreRejectsDirectory) {
	ScriptedExecutor executor;
	ControllerConfig config;
	config.restore_order = RestoreOrder::ValidateFirst;
	RuleManager manager(executor, config);

	BOOST_CHECK_THROW(manager.restore(std::filesystem::temp_directory_path().string()), ReadFailure);
	BOOST_CHECK(executor.commands.empty());
}

BOOST_AUTO_TEST_SUITE_END()
