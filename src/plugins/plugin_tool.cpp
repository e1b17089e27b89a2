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

// Headlamp Plugin Tool - Implementation

#include "plugin_tool.hpp"

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include <sys/wait.h>
#include <unistd.h>

#include "../core/logging.hpp"

namespace headlamp::plugins {

namespace {
constexpr const char* PLUGIN_NAME_FIELD = "pluginName";
constexpr size_t READ_CHUNK = 4096;

bool is_executable(const std::filesystem::path& path) {
    std::error_code ec;
    return ::access(path.c_str(), X_OK) == 0 && !std::filesystem::is_directory(path, ec);
}

// Same lookup the shell performs: names with a slash are used as-is, others go through PATH
bool executable_exists(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return is_executable(program);
    }

    const char* path_env = std::getenv("PATH");
    std::string_view dirs = path_env != nullptr ? path_env : "/usr/bin:/bin";
    while (true) {
        size_t colon = dirs.find(':');
        std::string_view dir = dirs.substr(0, colon);
        std::filesystem::path candidate =
            dir.empty() ? std::filesystem::path{program} : std::filesystem::path{dir} / program;
        if (is_executable(candidate)) {
            return true;
        }
        if (colon == std::string_view::npos) {
            return false;
        }
        dirs.remove_prefix(colon + 1);
    }
}

}  // namespace

// ============================
// Error category
// ============================

std::string PluginToolErrorCategory::message(int ev) const {
    switch (static_cast<PluginToolErrc>(ev)) {
        case PluginToolErrc::LaunchFailed:
            return "plugin tool could not be started";
        case PluginToolErrc::CommandFailed:
            return "plugin tool command failed";
        case PluginToolErrc::InvalidOutput:
            return "plugin tool returned invalid output";
        case PluginToolErrc::InvalidArgument:
            return "invalid plugin tool argument";
    }
    return "unknown plugin tool error";
}

const PluginToolErrorCategory& plugin_tool_category() noexcept {
    static PluginToolErrorCategory instance;
    return instance;
}

std::error_code make_error_code(PluginToolErrc e) noexcept {
    return {static_cast<int>(e), plugin_tool_category()};
}

// ============================
// PopenCommandRunner
// ============================

std::string PopenCommandRunner::shell_quote(std::string_view arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::optional<CommandResult> PopenCommandRunner::run(const std::vector<std::string>& argv,
                                                     std::error_code& error_out) {
    if (argv.empty()) {
        error_out = make_error_code(PluginToolErrc::InvalidArgument);
        return std::nullopt;
    }

    if (!executable_exists(argv.front())) {
        error_out = make_error_code(PluginToolErrc::LaunchFailed);
        return std::nullopt;
    }

    std::string command_line;
    for (const auto& arg : argv) {
        if (!command_line.empty()) {
            command_line += ' ';
        }
        command_line += shell_quote(arg);
    }

    FILE* pipe = ::popen(command_line.c_str(), "r");
    if (pipe == nullptr) {
        error_out = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }

    CommandResult result;
    std::array<char, READ_CHUNK> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = ::pclose(pipe);
    if (status == -1) {
        error_out = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;  // Killed by a signal
    }

    return result;
}

// ============================
// list --json parsing
// ============================

std::optional<std::vector<PluginInfo>> parse_plugin_list(std::string_view json,
                                                         std::string& error_out) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        error_out = fmt::format("list output is not JSON: {}", e.what());
        return std::nullopt;
    }

    if (!parsed.is_array()) {
        error_out = "list output must be a JSON array";
        return std::nullopt;
    }

    std::vector<PluginInfo> plugins;
    plugins.reserve(parsed.size());

    for (size_t i = 0; i < parsed.size(); ++i) {
        const auto& entry = parsed[i];
        if (!entry.is_object()) {
            error_out = fmt::format("list entry {} is not an object", i);
            return std::nullopt;
        }

        auto it = entry.find(PLUGIN_NAME_FIELD);
        if (it == entry.end() || !it->is_string()) {
            error_out = fmt::format("list entry {} has no string \"{}\" field", i,
                                    PLUGIN_NAME_FIELD);
            return std::nullopt;
        }

        plugins.push_back(PluginInfo{it->get<std::string>(), entry});
    }

    return plugins;
}

// ============================
// PluginTool
// ============================

PluginTool::PluginTool(std::vector<std::string> command, std::shared_ptr<CommandRunner> runner)
    : command_(std::move(command)), runner_(std::move(runner)) {}

std::vector<std::string> PluginTool::build_command(std::string_view subcommand,
                                                   const std::vector<std::string>& args) const {
    std::vector<std::string> argv = command_;
    argv.emplace_back(subcommand);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::optional<std::vector<PluginInfo>> PluginTool::list(std::error_code& error_out) {
    last_error_.clear();

    auto result = runner_->run(build_command("list", {"--json"}), error_out);
    if (!result.has_value()) {
        last_error_ = error_out.message();
        return std::nullopt;
    }

    if (result->exit_code != 0) {
        error_out = make_error_code(PluginToolErrc::CommandFailed);
        last_error_ = result->output;
        return std::nullopt;
    }

    auto plugins = parse_plugin_list(result->output, last_error_);
    if (!plugins.has_value()) {
        error_out = make_error_code(PluginToolErrc::InvalidOutput);
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "plugin tool list: {}", last_error_);
        }
        return std::nullopt;
    }

    return plugins;
}

bool PluginTool::run_simple(std::string_view subcommand, std::string_view arg,
                            std::error_code& error_out) {
    last_error_.clear();

    if (arg.empty()) {
        error_out = make_error_code(PluginToolErrc::InvalidArgument);
        last_error_ = fmt::format("{} needs a non-empty argument", subcommand);
        return false;
    }

    auto result = runner_->run(build_command(subcommand, {std::string{arg}}), error_out);
    if (!result.has_value()) {
        last_error_ = error_out.message();
        return false;
    }

    if (result->exit_code != 0) {
        error_out = make_error_code(PluginToolErrc::CommandFailed);
        last_error_ = result->output;
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "plugin tool {} {} exited with {}", subcommand, arg,
                      result->exit_code);
        }
        return false;
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "plugin tool {} {} succeeded", subcommand, arg);
    }
    return true;
}

bool PluginTool::install(std::string_view url, std::error_code& error_out) {
    return run_simple("install", url, error_out);
}

bool PluginTool::update(std::string_view name, std::error_code& error_out) {
    return run_simple("update", name, error_out);
}

bool PluginTool::uninstall(std::string_view name, std::error_code& error_out) {
    return run_simple("uninstall", name, error_out);
}

std::optional<bool> PluginTool::is_installed(std::string_view name, std::error_code& error_out) {
    auto plugins = list(error_out);
    if (!plugins.has_value()) {
        return std::nullopt;
    }

    for (const auto& plugin : *plugins) {
        if (plugin.plugin_name == name) {
            return true;
        }
    }
    return false;
}

}  // namespace headlamp::plugins
