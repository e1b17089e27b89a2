/*
 * Copyright 2025 Headlamp Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Headlamp Plugin Tool - Header
// Client for the external plugin-management CLI:
//   <tool> list --json | install <url> | update <name> | uninstall <name>

#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace headlamp::plugins {

/// Plugin tool failure kinds
enum class PluginToolErrc {
    LaunchFailed = 1,  // Tool could not be started
    CommandFailed,     // Tool exited with a non-zero status
    InvalidOutput,     // list --json output is not the expected shape
    InvalidArgument,   // Empty plugin name or URL
};

class PluginToolErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "plugin-tool"; }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const PluginToolErrorCategory& plugin_tool_category() noexcept;

[[nodiscard]] std::error_code make_error_code(PluginToolErrc e) noexcept;

/// Captured result of one tool invocation
struct CommandResult {
    int exit_code = -1;
    std::string output;  // stdout
};

/// Process launcher seam; tests substitute a scripted runner
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run argv[0] with the remaining arguments and capture stdout
    /// Returns nullopt (and sets error_out) if the process could not be started.
    [[nodiscard]] virtual std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                                           std::error_code& error_out) = 0;
};

/// Runs commands through /bin/sh with every argument single-quoted
/// argv[0] is looked up (directly or through PATH) before launching, so a missing
/// tool is LaunchFailed while any exit status of the tool itself, 127 included,
/// comes back in CommandResult.
class PopenCommandRunner final : public CommandRunner {
public:
    [[nodiscard]] std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                                   std::error_code& error_out) override;

    /// Quote one argument for a POSIX shell
    [[nodiscard]] static std::string shell_quote(std::string_view arg);
};

/// One entry of `list --json`
struct PluginInfo {
    std::string plugin_name;  // "pluginName", required
    nlohmann::json raw;       // Whole object, including fields this client does not model
};

/// Parse the `list --json` output: an array of objects with a string "pluginName"
[[nodiscard]] std::optional<std::vector<PluginInfo>> parse_plugin_list(std::string_view json,
                                                                       std::string& error_out);

/// Thin synchronous wrapper around the plugin-management CLI
/// The tool must reflect install/update/uninstall in the next list call.
class PluginTool {
public:
    /// @param command Tool invocation prefix, e.g. {"node", "bin/pluginctl.js"}
    PluginTool(std::vector<std::string> command, std::shared_ptr<CommandRunner> runner);

    [[nodiscard]] std::optional<std::vector<PluginInfo>> list(std::error_code& error_out);

    [[nodiscard]] bool install(std::string_view url, std::error_code& error_out);
    [[nodiscard]] bool update(std::string_view name, std::error_code& error_out);
    [[nodiscard]] bool uninstall(std::string_view name, std::error_code& error_out);

    /// True if `list` reports a plugin with this name
    [[nodiscard]] std::optional<bool> is_installed(std::string_view name,
                                                   std::error_code& error_out);

    /// Detail for the last failure (tool output or parse error)
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    /// Full argv for a subcommand, exposed for diagnostics
    [[nodiscard]] std::vector<std::string> build_command(
        std::string_view subcommand, const std::vector<std::string>& args) const;

private:
    [[nodiscard]] bool run_simple(std::string_view subcommand, std::string_view arg,
                                  std::error_code& error_out);

    std::vector<std::string> command_;
    std::shared_ptr<CommandRunner> runner_;
    std::string last_error_;
};

}  // namespace headlamp::plugins

template <>
struct std::is_error_code_enum<headlamp::plugins::PluginToolErrc> : std::true_type {};
