// Headlamp Plugin Tool Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <deque>

#include "../../src/plugins/plugin_tool.hpp"

using namespace headlamp::plugins;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Replays canned results and records every invocation
class ScriptedRunner final : public CommandRunner {
public:
    std::deque<std::optional<CommandResult>> results;
    std::error_code launch_error = make_error_code(PluginToolErrc::LaunchFailed);
    std::vector<std::vector<std::string>> calls;

    std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                     std::error_code& error_out) override {
        calls.push_back(argv);
        if (results.empty()) {
            error_out = launch_error;
            return std::nullopt;
        }
        auto result = results.front();
        results.pop_front();
        if (!result.has_value()) {
            error_out = launch_error;
        }
        return result;
    }
};

const std::vector<std::string> TOOL = {"node", "bin/pluginctl.js"};

}  // namespace

TEST_CASE("Plugin list parsing", "[plugins][plugin_tool]") {
    std::string error;

    SECTION("valid list keeps unknown fields") {
        auto plugins = parse_plugin_list(
            R"([{"pluginName":"prometheus","version":"0.1.0"},{"pluginName":"app-catalog"}])",
            error);
        REQUIRE(plugins.has_value());
        REQUIRE(plugins->size() == 2);
        REQUIRE((*plugins)[0].plugin_name == "prometheus");
        REQUIRE((*plugins)[0].raw["version"] == "0.1.0");
        REQUIRE((*plugins)[1].plugin_name == "app-catalog");
    }

    SECTION("empty list") {
        auto plugins = parse_plugin_list("[]", error);
        REQUIRE(plugins.has_value());
        REQUIRE(plugins->empty());
    }

    SECTION("not JSON") {
        REQUIRE_FALSE(parse_plugin_list("No plugins installed", error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("not JSON"));
    }

    SECTION("not an array") {
        REQUIRE_FALSE(parse_plugin_list(R"({"pluginName":"x"})", error).has_value());
        REQUIRE(error == "list output must be a JSON array");
    }

    SECTION("entry without pluginName") {
        REQUIRE_FALSE(parse_plugin_list(R"([{"pluginName":"a"},{"name":"b"}])", error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("list entry 1"));
    }

    SECTION("non-string pluginName") {
        REQUIRE_FALSE(parse_plugin_list(R"([{"pluginName":5}])", error).has_value());
    }
}

TEST_CASE("Plugin tool commands", "[plugins][plugin_tool]") {
    auto runner = std::make_shared<ScriptedRunner>();
    PluginTool tool{TOOL, runner};
    std::error_code ec;

    SECTION("command lines") {
        REQUIRE(tool.build_command("list", {"--json"}) ==
                std::vector<std::string>{"node", "bin/pluginctl.js", "list", "--json"});
        REQUIRE(tool.build_command("uninstall", {"my-plugin"}) ==
                std::vector<std::string>{"node", "bin/pluginctl.js", "uninstall", "my-plugin"});
    }

    SECTION("install then list reflects the new plugin") {
        runner->results.push_back(CommandResult{0, "installed\n"});
        runner->results.push_back(CommandResult{0, R"([{"pluginName":"my-plugin"}])"});

        REQUIRE(tool.install("https://artifacthub.io/packages/headlamp/x/my-plugin", ec));
        REQUIRE_FALSE(ec);

        auto installed = tool.is_installed("my-plugin", ec);
        REQUIRE(installed.has_value());
        REQUIRE(*installed);

        REQUIRE(runner->calls.size() == 2);
        REQUIRE(runner->calls[0][2] == "install");
        REQUIRE(runner->calls[1] ==
                std::vector<std::string>{"node", "bin/pluginctl.js", "list", "--json"});
    }

    SECTION("uninstall then list no longer reports it") {
        runner->results.push_back(CommandResult{0, ""});
        runner->results.push_back(CommandResult{0, "[]"});

        REQUIRE(tool.uninstall("my-plugin", ec));
        auto installed = tool.is_installed("my-plugin", ec);
        REQUIRE(installed.has_value());
        REQUIRE_FALSE(*installed);
    }

    SECTION("update passes the plugin name") {
        runner->results.push_back(CommandResult{0, ""});
        REQUIRE(tool.update("my-plugin", ec));
        REQUIRE(runner->calls.back() ==
                std::vector<std::string>{"node", "bin/pluginctl.js", "update", "my-plugin"});
    }

    SECTION("empty arguments are rejected without running the tool") {
        REQUIRE_FALSE(tool.install("", ec));
        REQUIRE(ec == PluginToolErrc::InvalidArgument);
        REQUIRE_FALSE(tool.uninstall("", ec));
        REQUIRE(runner->calls.empty());
    }

    SECTION("non-zero exit") {
        runner->results.push_back(CommandResult{1, "plugin not found"});
        REQUIRE_FALSE(tool.update("missing", ec));
        REQUIRE(ec == PluginToolErrc::CommandFailed);
        REQUIRE(tool.last_error() == "plugin not found");
    }

    SECTION("launch failure") {
        REQUIRE_FALSE(tool.list(ec).has_value());
        REQUIRE(ec == PluginToolErrc::LaunchFailed);
        REQUIRE_FALSE(tool.last_error().empty());
    }

    SECTION("malformed list output") {
        runner->results.push_back(CommandResult{0, "not json"});
        REQUIRE_FALSE(tool.list(ec).has_value());
        REQUIRE(ec == PluginToolErrc::InvalidOutput);

        runner->results.push_back(CommandResult{0, "not json"});
        REQUIRE_FALSE(tool.is_installed("x", ec).has_value());
    }
}

TEST_CASE("Plugin tool error category", "[plugins][plugin_tool]") {
    std::error_code ec = PluginToolErrc::CommandFailed;
    REQUIRE(std::string{ec.category().name()} == "plugin-tool");
    REQUIRE(ec.message() == "plugin tool command failed");
}

TEST_CASE("Shell quoting", "[plugins][plugin_tool]") {
    REQUIRE(PopenCommandRunner::shell_quote("plain") == "'plain'");
    REQUIRE(PopenCommandRunner::shell_quote("") == "''");
    REQUIRE(PopenCommandRunner::shell_quote("a b;rm -rf /") == "'a b;rm -rf /'");
    REQUIRE(PopenCommandRunner::shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("Popen runner", "[plugins][plugin_tool][process]") {
    PopenCommandRunner runner;
    std::error_code ec;

    SECTION("captures stdout and exit status") {
        auto result = runner.run({"sh", "-c", "printf '[]'; exit 3"}, ec);
        REQUIRE(result.has_value());
        REQUIRE(result->output == "[]");
        REQUIRE(result->exit_code == 3);
    }

    SECTION("missing executable") {
        auto result = runner.run({"/nonexistent/headlamp-plugin-tool"}, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == PluginToolErrc::LaunchFailed);

        REQUIRE_FALSE(runner.run({"headlamp-no-such-plugin-tool"}, ec).has_value());
        REQUIRE(ec == PluginToolErrc::LaunchFailed);
    }

    SECTION("tool exiting with 127 is a normal result") {
        auto result = runner.run({"sh", "-c", "printf 'no such plugin'; exit 127"}, ec);
        REQUIRE(result.has_value());
        REQUIRE(result->exit_code == 127);
        REQUIRE(result->output == "no such plugin");
    }

    SECTION("empty command") {
        REQUIRE_FALSE(runner.run({}, ec).has_value());
        REQUIRE(ec == PluginToolErrc::InvalidArgument);
    }
}
