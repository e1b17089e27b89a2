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

// Headlamp Platform - Header
// Filesystem and user-directory lookups used while resolving configuration

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace headlamp::core {

/// Snapshot of the process environment (name -> value)
class Environment {
public:
    Environment() = default;
    explicit Environment(std::map<std::string, std::string> vars) : vars_(std::move(vars)) {}

    /// Capture the current process environment
    [[nodiscard]] static Environment from_process();

    /// Build from a NAME=VALUE array terminated by nullptr (envp / environ layout)
    [[nodiscard]] static Environment from_envp(const char* const* envp);

    /// Value of a variable, nullopt if not present (present-but-empty is "")
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

    void set(std::string name, std::string value) { vars_[std::move(name)] = std::move(value); }

    [[nodiscard]] const std::map<std::string, std::string>& vars() const noexcept { return vars_; }

private:
    std::map<std::string, std::string> vars_;
};

/// OS capabilities needed for default paths
/// Production code uses SystemPlatform; tests substitute a fake.
class Platform {
public:
    virtual ~Platform() = default;

    /// Per-user configuration root (XDG_CONFIG_HOME, ~/Library/Application Support, %AppData%)
    [[nodiscard]] virtual std::optional<std::filesystem::path> user_config_dir() const = 0;

    /// Home directory of the current user
    [[nodiscard]] virtual std::optional<std::filesystem::path> home_dir() const = 0;

    /// Absolute path of the running executable
    [[nodiscard]] virtual std::optional<std::filesystem::path> executable_path() const = 0;

    /// mkdir -p with mode 0755; an existing directory is success
    [[nodiscard]] virtual std::error_code create_directories(
        const std::filesystem::path& dir) const = 0;

    [[nodiscard]] virtual bool is_windows() const noexcept = 0;
};

/// Platform backed by the real OS and the given environment snapshot
class SystemPlatform final : public Platform {
public:
    explicit SystemPlatform(Environment env) : env_(std::move(env)) {}

    [[nodiscard]] std::optional<std::filesystem::path> user_config_dir() const override;
    [[nodiscard]] std::optional<std::filesystem::path> home_dir() const override;
    [[nodiscard]] std::optional<std::filesystem::path> executable_path() const override;
    [[nodiscard]] std::error_code create_directories(
        const std::filesystem::path& dir) const override;
    [[nodiscard]] bool is_windows() const noexcept override;

private:
    Environment env_;
};

}  // namespace headlamp::core
